#include "hos_planner/compliance_checker.hpp"

#include <optional>

#include <fmt/format.h>

#include "hos_planner/logging.hpp"
#include "hos_planner/planner_options.hpp"

namespace hos_planner {

namespace {
constexpr double k_limit_tolerance_hours{1e-6};
}  // namespace

std::vector<ShiftTotals> delimit_shifts(const DutyEventList& events) {
    std::vector<ShiftTotals> shifts;
    std::optional<ShiftTotals> current_shift;

    for (const DutyEvent& event : events) {
        if (event.is_on_duty()) {
            if (!current_shift.has_value()) {
                current_shift = ShiftTotals{event.start_time, 0.0, 0.0};
            }
            current_shift->on_duty_hours += event.duration_hours;
            if (event.status == DutyStatus::Driving) {
                current_shift->driving_hours += event.duration_hours;
            }
            continue;
        }
        if (event.duration_hours >= limits::k_min_off_duty_hours && current_shift.has_value()) {
            shifts.push_back(current_shift.value());
            current_shift.reset();
        }
    }

    // Activity after the last qualifying rest is an open shift and is not audited.
    return shifts;
}

ComplianceReport check_compliance(const DutyEventList& events) {
    ComplianceReport report{};
    report.shifts = delimit_shifts(events);
    report.total_shifts = static_cast<int>(report.shifts.size());

    for (std::size_t index = 0; index < report.shifts.size(); ++index) {
        const ShiftTotals& shift = report.shifts[index];
        if (shift.driving_hours > limits::k_max_driving_hours + k_limit_tolerance_hours) {
            report.violations.push_back(fmt::format("Shift {}: Exceeded 11-hour driving limit ({:.2f} h)", index + 1, shift.driving_hours));
        }
        if (shift.on_duty_hours > limits::k_max_on_duty_hours + k_limit_tolerance_hours) {
            report.violations.push_back(fmt::format("Shift {}: Exceeded 14-hour on-duty limit ({:.2f} h)", index + 1, shift.on_duty_hours));
        }
    }
    report.compliant = report.violations.empty();

    auto logger = get_logger();
    if (report.compliant) {
        logger->info("Compliance audit passed across {} shifts", report.total_shifts);
    } else {
        for (const std::string& violation : report.violations) {
            logger->warn("Compliance violation: {}", violation);
        }
    }
    return report;
}

}  // namespace hos_planner
