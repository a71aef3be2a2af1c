#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>

#include "hos_planner/duty_event.hpp"
#include "hos_planner/route_leg_builder.hpp"

namespace hos_planner::test {

inline constexpr Coordinate k_current{41.8781, -87.6298};
inline constexpr Coordinate k_pickup{39.7684, -86.1581};
inline constexpr Coordinate k_dropoff{33.7490, -84.3880};

/** @brief 2024-03-04 06:00 UTC. */
inline TimePoint monday_morning() {
    return TimePoint{std::chrono::sys_days{std::chrono::year{2024} / 3 / 4}} + std::chrono::hours{6};
}

inline RouteLegList make_legs(double to_pickup_miles, double to_dropoff_miles) {
    return build_route_legs(k_current, k_pickup, k_dropoff,
                            LegEstimate{to_pickup_miles, to_pickup_miles / 55.0},
                            LegEstimate{to_dropoff_miles, to_dropoff_miles / 55.0});
}

inline RouteLegList make_dropoff_only_leg(double miles) {
    return build_route_legs(k_current, k_pickup, k_dropoff, std::nullopt, LegEstimate{miles, miles / 55.0});
}

inline std::size_t count_activity(const DutyEventList& events, std::string_view activity) {
    return static_cast<std::size_t>(std::count_if(events.begin(), events.end(), [activity](const DutyEvent& event) {
        return event.activity == activity;
    }));
}

inline std::size_t count_rest_kind(const DutyEventList& events, RestBreakKind kind) {
    return static_cast<std::size_t>(std::count_if(events.begin(), events.end(), [kind](const DutyEvent& event) {
        return event.rest_break.has_value() && event.rest_break->kind == kind;
    }));
}

/** @brief Driving hours accumulated before the first rest of at least 10 hours. */
inline double first_shift_driving_hours(const DutyEventList& events) {
    double driving_hours = 0.0;
    for (const DutyEvent& event : events) {
        if (!event.is_on_duty() && event.duration_hours >= 10.0) {
            break;
        }
        if (event.status == DutyStatus::Driving) {
            driving_hours += event.duration_hours;
        }
    }
    return driving_hours;
}

/** @brief On-duty hours accumulated before the first rest of at least 10 hours. */
inline double first_shift_on_duty_hours(const DutyEventList& events) {
    double on_duty_hours = 0.0;
    for (const DutyEvent& event : events) {
        if (!event.is_on_duty() && event.duration_hours >= 10.0) {
            break;
        }
        if (event.is_on_duty()) {
            on_duty_hours += event.duration_hours;
        }
    }
    return on_duty_hours;
}

}  // namespace hos_planner::test
