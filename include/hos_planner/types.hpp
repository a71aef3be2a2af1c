// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the planner (time primitives, coordinates, duty statuses, weekly modes).

#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace hos_planner {

/**
 * @brief Wall clock used for trip timestamps; calendar days are derived from it.
 */
using SystemClock = std::chrono::system_clock;

/**
 * @brief Alias for timestamps on the planning timeline.
 */
using TimePoint = std::chrono::time_point<SystemClock>;

/**
 * @brief Alias for durations measured in hours with double precision.
 */
using Hours = std::chrono::duration<double, std::ratio<3600>>;

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct Coordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
};

/**
 * @brief Regulatory classification of a logged time interval.
 */
enum class DutyStatus {
    OffDuty,           /**< Line 1: off duty. */
    SleeperBerth,      /**< Line 2: sleeper berth. */
    Driving,           /**< Line 3: driving. */
    OnDutyNotDriving   /**< Line 4: on duty, not driving. */
};

/**
 * @brief Weekly cycle rule applied to the driver.
 */
enum class WeeklyMode {
    SeventyEight,  /**< 70 hours over 8 days. */
    SixtySeven     /**< 60 hours over 7 days. */
};

/**
 * @brief Split sleeper berth pairing requested by the carrier.
 */
enum class SplitSleeperOption {
    SevenThree,  /**< 7 hour + 3 hour pairing. */
    EightTwo     /**< 8 hour + 2 hour pairing; accepted but never scheduled. */
};

/** @brief Maximum on-duty hours allowed by the weekly cycle. */
[[nodiscard]] double weekly_max_hours(WeeklyMode mode) noexcept;
/** @brief Number of trailing days the weekly cycle covers. */
[[nodiscard]] int weekly_window_days(WeeklyMode mode) noexcept;

/** @brief Parse "70/8" or "60/7"; throws std::invalid_argument otherwise. */
[[nodiscard]] WeeklyMode parse_weekly_mode(std::string_view text);
/** @brief Parse "7/3" or "8/2"; throws std::invalid_argument otherwise. */
[[nodiscard]] SplitSleeperOption parse_split_sleeper_option(std::string_view text);

[[nodiscard]] std::string_view to_string(DutyStatus status) noexcept;
[[nodiscard]] std::string_view to_string(WeeklyMode mode) noexcept;
[[nodiscard]] std::string_view to_string(SplitSleeperOption option) noexcept;

/** @brief Convert fractional hours into the clock's native duration. */
[[nodiscard]] SystemClock::duration to_clock_duration(double hours);

/** @brief Truncate a timestamp to midnight of its calendar day. */
[[nodiscard]] TimePoint start_of_day(TimePoint time_point);
/** @brief Render the calendar date of @p time_point as YYYY-MM-DD. */
[[nodiscard]] std::string format_date(TimePoint time_point);
/** @brief Render @p time_point as YYYY-MM-DDTHH:MM. */
[[nodiscard]] std::string format_timestamp(TimePoint time_point);

}  // namespace hos_planner
