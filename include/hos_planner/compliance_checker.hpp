// === Compliance Checker ======================================================
//
// Baseline audit of a duty timeline. Shifts are re-derived from the events
// alone and held to the fixed 11-hour driving and 14-hour on-duty limits; no
// exception is re-applied, so timelines that lean on split sleeper, adverse
// conditions, or the short-haul window are reported.

#pragma once

#include <string>
#include <vector>

#include "hos_planner/duty_event.hpp"

namespace hos_planner {

/** @brief Totals for one shift as delimited by qualifying rest. */
struct ShiftTotals final {
    TimePoint start_time{};
    double driving_hours{};
    double on_duty_hours{};   /**< Driving plus on duty not driving. */
};

/** @brief Verdict of the baseline audit. */
struct ComplianceReport final {
    bool compliant{true};
    std::vector<std::string> violations{};
    int total_shifts{};
    std::vector<ShiftTotals> shifts{};
};

/**
 * @brief Split @p events into shifts closed by rests of at least 10 hours.
 *
 * On-duty time after the final qualifying rest forms no shift.
 */
[[nodiscard]] std::vector<ShiftTotals> delimit_shifts(const DutyEventList& events);

/** @brief Audit @p events against the baseline driving and on-duty limits. */
[[nodiscard]] ComplianceReport check_compliance(const DutyEventList& events);

}  // namespace hos_planner
