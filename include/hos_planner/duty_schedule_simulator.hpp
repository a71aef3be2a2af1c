// === Duty Schedule Simulator =================================================
//
// Greedy hours-of-service simulation. Walks the ordered route legs and
// interleaves driving increments with 30-minute breaks, rest periods (split
// sleeper, 34-hour restart, standard 10-hour rest), fueling stops, and
// pickup/dropoff/inspection overhead so that each shift stays inside its
// driving ceiling, on-duty window, and the weekly cycle budget.
//
// All mutable counters live in a SimulationState created per simulate() call;
// the simulator object itself is immutable and may be shared across threads.

#pragma once

#include <memory>
#include <optional>

#include "hos_planner/duty_event.hpp"
#include "hos_planner/errors.hpp"
#include "hos_planner/location_resolver.hpp"
#include "hos_planner/logging.hpp"
#include "hos_planner/planner_options.hpp"
#include "hos_planner/route_leg_builder.hpp"

namespace hos_planner {

/** @brief Counters owned by a single simulation run. */
struct SimulationState final {
    TimePoint current_time{};
    double shift_driving_hours{};
    double shift_on_duty_hours{};
    double continuous_driving_hours{};
    double total_distance_miles{};
    double remaining_weekly_hours{};
    std::optional<int> pending_split_segment{};
    std::optional<Coordinate> work_reporting_location{};
    int short_haul_exceptions_used{};
    bool adverse_conditions_active{};
    bool air_mile_exception_active{};
    std::optional<TimePoint> last_full_restart{};
    int next_segment_id{1};
};

/** @brief Limits that apply to the shift currently being driven. */
struct ShiftCeilings final {
    double driving_hours{};
    double on_duty_hours{};
    bool short_haul_applied{};
};

/** @brief Finished timeline plus any degrade-and-continue conditions. */
struct DutySchedule final {
    DutyEventList events{};
    PlanWarningList warnings{};
    SimulationState final_state{};   /**< Counters after the post-trip inspection. */
};

/** @brief Produces the ordered duty-event timeline for a trip. */
class DutyScheduleSimulator final {
  public:
    /**
     * @param options Weekly mode, cycle hours already used, and exception flags.
     * @param resolver Place lookup capability; a NullLocationResolver is used
     *        when none is supplied.
     * @throws std::invalid_argument when the cycle hours are negative.
     */
    explicit DutyScheduleSimulator(PlannerOptions options, LocationResolverPtr resolver = nullptr);

    [[nodiscard]] const PlannerOptions& options() const noexcept;

    /** @brief Counters a fresh run starts from. */
    [[nodiscard]] SimulationState initial_state(TimePoint start_time) const;

    /**
     * @brief Simulate the whole trip.
     *
     * @throws InsufficientInputError when @p legs is empty.
     */
    [[nodiscard]] DutySchedule simulate(const RouteLegList& legs, TimePoint start_time) const;

  private:
    void drive_leg(const RouteLeg& leg, SimulationState& state, DutyEventList& events) const;
    void perform_on_duty_task(SimulationState& state,
                              DutyEventList& events,
                              const char* activity,
                              double hours,
                              const Coordinate& location,
                              const std::optional<ResolvedPlace>& place,
                              const char* description) const;
    void take_break(SimulationState& state, DutyEventList& events, const Coordinate& location) const;
    void take_rest(SimulationState& state, DutyEventList& events, const Coordinate& location) const;

    [[nodiscard]] ShiftCeilings shift_ceilings(const SimulationState& state) const noexcept;
    [[nodiscard]] bool short_haul_eligible(const SimulationState& state) const noexcept;
    [[nodiscard]] bool rest_needed(const SimulationState& state, const ShiftCeilings& ceilings) const noexcept;

    PlannerOptions options_;
    LocationResolverPtr resolver_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace hos_planner
