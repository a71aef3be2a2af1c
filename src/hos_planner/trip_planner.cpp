#include "hos_planner/trip_planner.hpp"

#include <numeric>

#include "hos_planner/logging.hpp"

namespace hos_planner {

TripSummary summarize_trip(const DutyEventList& events, TimePoint start_time) {
    TripSummary summary{};
    summary.start_time = start_time;
    summary.end_time = start_time;
    if (events.empty()) {
        return summary;
    }

    for (const DutyEvent& event : events) {
        switch (event.status) {
            case DutyStatus::Driving:
                summary.total_driving_hours += event.duration_hours;
                summary.total_on_duty_hours += event.duration_hours;
                break;
            case DutyStatus::OnDutyNotDriving:
                summary.total_on_duty_hours += event.duration_hours;
                break;
            case DutyStatus::OffDuty:
            case DutyStatus::SleeperBerth:
                summary.total_rest_hours += event.duration_hours;
                break;
        }
        if (event.activity == "Fueling" || event.activity == "30-Minute Break") {
            ++summary.number_of_stops;
        }
        if (event.rest_break.has_value()) {
            ++summary.rest_breaks;
        }
    }

    summary.total_duration_hours = events.back().end_offset_hours;
    summary.end_time = start_time + to_clock_duration(summary.total_duration_hours);
    return summary;
}

TripPlan calculate_trip_plan(const TripRequest& request, LocationResolverPtr resolver) {
    auto logger = get_logger();

    TripPlan plan{};
    plan.legs = build_route_legs(
        request.current_location,
        request.pickup_location,
        request.dropoff_location,
        request.leg_to_pickup,
        request.leg_to_dropoff,
        request.allow_straight_line_fallback
    );

    plan.total_distance_miles = std::accumulate(plan.legs.begin(), plan.legs.end(), 0.0, [](double total, const RouteLeg& leg) {
        return total + leg.distance_miles;
    });
    plan.total_driving_hours = std::accumulate(plan.legs.begin(), plan.legs.end(), 0.0, [](double total, const RouteLeg& leg) {
        return total + leg.duration_hours;
    });
    logger->info("Planning trip of {:.1f} mi across {} legs starting {}",
                 plan.total_distance_miles,
                 plan.legs.size(),
                 format_timestamp(request.start_time));

    const DutyScheduleSimulator simulator{request.options, std::move(resolver)};
    DutySchedule schedule = simulator.simulate(plan.legs, request.start_time);

    plan.events = std::move(schedule.events);
    plan.warnings = std::move(schedule.warnings);
    plan.total_elapsed_hours = plan.events.back().end_offset_hours;
    plan.daily_logs = aggregate_daily_logs(plan.events);
    plan.compliance = check_compliance(plan.events);
    plan.summary = summarize_trip(plan.events, request.start_time);

    logger->info("Trip plan ready: {:.1f} h elapsed, {} daily logs, {} rest breaks, compliant={}",
                 plan.total_elapsed_hours,
                 plan.daily_logs.size(),
                 plan.summary.rest_breaks,
                 plan.compliance.compliant);
    return plan;
}

}  // namespace hos_planner
