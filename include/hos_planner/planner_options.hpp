// === Planner Options =========================================================
//
// Regulatory constants for property-carrying drivers and the per-request
// options that select weekly mode and exceptions.

#pragma once

#include "hos_planner/types.hpp"

namespace hos_planner {

/** @brief Fixed hours-of-service and operational constants. */
namespace limits {
inline constexpr double k_max_driving_hours{11.0};
inline constexpr double k_adverse_driving_extension_hours{2.0};
inline constexpr double k_max_on_duty_hours{14.0};
inline constexpr double k_short_haul_on_duty_hours{16.0};
inline constexpr double k_min_off_duty_hours{10.0};
inline constexpr double k_break_required_after_hours{8.0};
inline constexpr double k_min_break_hours{0.5};
inline constexpr double k_restart_hours{34.0};
inline constexpr double k_restart_threshold_hours{14.0};
inline constexpr double k_split_long_segment_hours{7.0};
inline constexpr double k_split_short_segment_hours{3.0};
inline constexpr double k_average_speed_mph{60.0};
inline constexpr double k_fueling_interval_miles{1'000.0};
inline constexpr double k_fueling_hours{0.5};
inline constexpr double k_pickup_dropoff_hours{1.0};
inline constexpr double k_inspection_hours{0.25};
inline constexpr int k_short_haul_min_reporting_days{5};
inline constexpr int k_short_haul_uses_per_cycle{1};
}  // namespace limits

/**
 * @brief Per-request planning options.
 *
 * Populated from Configuration by the application or directly by callers.
 */
struct PlannerOptions final {
    double current_cycle_used_hours{};                                  /**< Hours already used in the weekly cycle. */
    WeeklyMode weekly_mode{WeeklyMode::SeventyEight};                   /**< 70/8 or 60/7. */
    bool use_split_sleeper{};                                           /**< Split the 10-hour rest into sleeper segments. */
    SplitSleeperOption split_sleeper_option{SplitSleeperOption::SevenThree}; /**< Only 7/3 is scheduled. */
    bool adverse_conditions{};                                          /**< Extend the driving ceiling by 2 hours. */
    bool air_mile_exception{};                                          /**< Allow the 16-hour short-haul window. */
    int days_at_reporting_location{};                                   /**< Consecutive days the driver reported to the same location. */

    /** @brief True when any regulatory exception alters the baseline rules. */
    [[nodiscard]] bool any_exception_active() const noexcept {
        return use_split_sleeper || adverse_conditions || air_mile_exception;
    }
};

}  // namespace hos_planner
