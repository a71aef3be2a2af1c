// === Daily Logs ==============================================================
//
// Buckets a finished duty timeline into per-calendar-day log sheets. An event
// belongs entirely to the day its start timestamp falls on, even when it runs
// past midnight; long rests therefore inflate the day they begin on.
//
// Days are UTC calendar days: timestamps are system_clock time points and a
// day starts at 00:00 UTC. Shift the trip start time to local wall-clock time
// beforehand to get local-day sheets.

#pragma once

#include <vector>

#include "hos_planner/duty_event.hpp"

namespace hos_planner {

/** @brief One driver's daily log sheet. */
struct DailyLog final {
    TimePoint date{};                 /**< 00:00 UTC of the log's calendar day. */
    DutyEventList events{};
    double total_driving_hours{};
    double total_on_duty_hours{};     /**< On duty not driving. */
    double total_off_duty_hours{};
    double total_sleeper_hours{};
    double total_miles{};

    /** @brief Sum of all four status totals. */
    [[nodiscard]] double total_hours() const noexcept;
};

using DailyLogList = std::vector<DailyLog>;

/** @brief Group @p events by start date, ordered by date. */
[[nodiscard]] DailyLogList aggregate_daily_logs(const DutyEventList& events);

}  // namespace hos_planner
