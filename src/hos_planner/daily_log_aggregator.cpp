#include "hos_planner/daily_log_aggregator.hpp"

namespace hos_planner {

double DailyLog::total_hours() const noexcept {
    return total_driving_hours + total_on_duty_hours + total_off_duty_hours + total_sleeper_hours;
}

DailyLogList aggregate_daily_logs(const DutyEventList& events) {
    DailyLogList logs;
    for (const DutyEvent& event : events) {
        const TimePoint event_date = start_of_day(event.start_time);
        if (logs.empty() || logs.back().date != event_date) {
            DailyLog log{};
            log.date = event_date;
            logs.push_back(std::move(log));
        }

        DailyLog& current_log = logs.back();
        current_log.events.push_back(event);
        switch (event.status) {
            case DutyStatus::Driving:
                current_log.total_driving_hours += event.duration_hours;
                current_log.total_miles += event.distance_miles.value_or(0.0);
                break;
            case DutyStatus::OnDutyNotDriving:
                current_log.total_on_duty_hours += event.duration_hours;
                break;
            case DutyStatus::OffDuty:
                current_log.total_off_duty_hours += event.duration_hours;
                break;
            case DutyStatus::SleeperBerth:
                current_log.total_sleeper_hours += event.duration_hours;
                break;
        }
    }
    return logs;
}

}  // namespace hos_planner
