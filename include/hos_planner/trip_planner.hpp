// === Trip Planner ============================================================
//
// Entry point tying the pieces together: legs are built from the request, the
// duty schedule is simulated, and the timeline is aggregated into daily logs,
// audited for compliance, and summarized.

#pragma once

#include <optional>

#include "hos_planner/compliance_checker.hpp"
#include "hos_planner/daily_log_aggregator.hpp"
#include "hos_planner/duty_schedule_simulator.hpp"
#include "hos_planner/errors.hpp"
#include "hos_planner/location_resolver.hpp"
#include "hos_planner/planner_options.hpp"
#include "hos_planner/route_leg_builder.hpp"

namespace hos_planner {

/** @brief Everything needed to plan one current -> pickup -> dropoff trip. */
struct TripRequest final {
    Coordinate current_location{};
    Coordinate pickup_location{};
    Coordinate dropoff_location{};
    std::optional<LegEstimate> leg_to_pickup{};    /**< Routed figures for leg 1, if available. */
    std::optional<LegEstimate> leg_to_dropoff{};   /**< Routed figures for leg 2, if available. */
    bool allow_straight_line_fallback{};           /**< Estimate missing legs from coordinates. */
    PlannerOptions options{};
    TimePoint start_time{SystemClock::now()};
};

/** @brief Headline figures for a planned trip. */
struct TripSummary final {
    TimePoint start_time{};
    TimePoint end_time{};
    double total_duration_hours{};
    double total_driving_hours{};
    double total_on_duty_hours{};
    double total_rest_hours{};
    int number_of_stops{};   /**< Fueling stops and 30-minute breaks. */
    int rest_breaks{};       /**< Events carrying rest-break metadata. */
};

/** @brief Complete result of calculate_trip_plan. */
struct TripPlan final {
    double total_distance_miles{};
    double total_driving_hours{};      /**< Nominal routed driving time. */
    double total_elapsed_hours{};
    RouteLegList legs{};
    DutyEventList events{};
    DailyLogList daily_logs{};
    ComplianceReport compliance{};
    TripSummary summary{};
    PlanWarningList warnings{};
};

/** @brief Derive headline figures from a finished timeline. */
[[nodiscard]] TripSummary summarize_trip(const DutyEventList& events, TimePoint start_time);

/**
 * @brief Plan a trip end to end.
 *
 * @throws InsufficientInputError when no route leg can be formed.
 * @throws std::invalid_argument on malformed request values.
 */
[[nodiscard]] TripPlan calculate_trip_plan(const TripRequest& request, LocationResolverPtr resolver = nullptr);

}  // namespace hos_planner
