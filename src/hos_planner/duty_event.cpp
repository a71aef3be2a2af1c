#include "hos_planner/duty_event.hpp"

namespace hos_planner {

TimePoint DutyEvent::end_time() const {
    return start_time + to_clock_duration(duration_hours);
}

bool DutyEvent::is_on_duty() const noexcept {
    return status == DutyStatus::Driving || status == DutyStatus::OnDutyNotDriving;
}

std::string_view to_string(RestBreakKind kind) noexcept {
    switch (kind) {
        case RestBreakKind::SplitSleeperSegment1:
            return "split_sleeper_segment_1";
        case RestBreakKind::SplitSleeperSegment2:
            return "split_sleeper_segment_2";
        case RestBreakKind::FullRestart:
            return "full_restart";
        case RestBreakKind::FullRest:
            return "full_rest";
    }
    return "unknown";
}

void assign_timeline_offsets(DutyEventList& events) {
    double cumulative_hours = 0.0;
    for (DutyEvent& event : events) {
        event.start_offset_hours = cumulative_hours;
        event.end_offset_hours = cumulative_hours + event.duration_hours;
        cumulative_hours = event.end_offset_hours;
    }
}

}  // namespace hos_planner
