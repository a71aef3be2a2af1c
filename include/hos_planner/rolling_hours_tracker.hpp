// === Rolling Hours ===========================================================
//
// Weekly-cycle accounting over caller-supplied duty history: hours used in the
// trailing 7 or 8 entries and hours still available. Also parses the plain
// text history format ("YYYY-MM-DD,hours" per line) used by the application.

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hos_planner/errors.hpp"
#include "hos_planner/types.hpp"

namespace hos_planner {

/** @brief On-duty hours recorded for one calendar day. */
struct DutyHistoryEntry final {
    TimePoint date{};
    double on_duty_hours{};
};

using DutyHistory = std::vector<DutyHistoryEntry>;

/** @brief Hours used/available within the trailing weekly window. */
struct RollingHoursSummary final {
    double hours_used{};
    double hours_available{};
    WeeklyMode weekly_mode{WeeklyMode::SeventyEight};
    DutyHistory daily_breakdown{};   /**< Entries inside the window, oldest first. */
};

/** @brief Parsed history plus the records that needed recovery. */
struct DutyHistoryParseResult final {
    DutyHistory entries{};
    PlanWarningList warnings{};
};

/** @brief Summarize the trailing window of @p history for @p mode. */
[[nodiscard]] RollingHoursSummary rolling_hours(DutyHistory history, WeeklyMode mode);

/**
 * @brief Parse history lines, recovering from malformed records.
 *
 * @throws NoValidLogsError when records were present but none could be used.
 */
[[nodiscard]] DutyHistoryParseResult parse_duty_history(const std::vector<std::string>& lines);

/**
 * @brief Read and parse a history file.
 *
 * @throws std::runtime_error when the file cannot be opened.
 * @throws NoValidLogsError when no record in the file is usable.
 */
[[nodiscard]] DutyHistoryParseResult load_duty_history(const std::filesystem::path& path);

/** @brief Parse a YYYY-MM-DD date into midnight of that day. */
[[nodiscard]] std::optional<TimePoint> parse_date(std::string_view text);

}  // namespace hos_planner
