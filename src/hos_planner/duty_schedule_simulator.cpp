#include "hos_planner/duty_schedule_simulator.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace hos_planner {

namespace {

constexpr double k_hours_epsilon{1e-6};     /**< Tolerance when comparing accumulated hours to ceilings. */
constexpr double k_distance_epsilon{1e-6};  /**< Miles below which a leg counts as driven. */

/**
 * @brief Position along @p leg once @p remaining_miles are left to drive.
 */
Coordinate interpolate_along_leg(const RouteLeg& leg, double remaining_miles) {
    if (leg.distance_miles <= 0.0) {
        return leg.start;
    }
    const double fraction = std::clamp((leg.distance_miles - remaining_miles) / leg.distance_miles, 0.0, 1.0);
    return Coordinate{
        leg.start.latitude_deg + (leg.end.latitude_deg - leg.start.latitude_deg) * fraction,
        leg.start.longitude_deg + (leg.end.longitude_deg - leg.start.longitude_deg) * fraction
    };
}

/**
 * @brief Next multiple of the fueling interval strictly ahead of @p total_miles.
 */
double next_fueling_boundary(double total_miles) {
    const double interval = limits::k_fueling_interval_miles;
    return (std::floor((total_miles + k_distance_epsilon) / interval) + 1.0) * interval;
}

DutyEvent& append_event(SimulationState& state,
                        DutyEventList& events,
                        std::string activity,
                        DutyStatus status,
                        double hours,
                        const Coordinate& location,
                        std::string description) {
    DutyEvent event{};
    event.activity = std::move(activity);
    event.status = status;
    event.start_time = state.current_time;
    event.duration_hours = hours;
    event.location = location;
    event.description = std::move(description);
    event.remaining_weekly_hours = state.remaining_weekly_hours;
    events.push_back(std::move(event));
    state.current_time += to_clock_duration(hours);
    return events.back();
}

void charge_on_duty(SimulationState& state, DutyEvent& event) {
    state.shift_on_duty_hours += event.duration_hours;
    state.remaining_weekly_hours = std::max(0.0, state.remaining_weekly_hours - event.duration_hours);
    event.remaining_weekly_hours = state.remaining_weekly_hours;
}

void reset_shift(SimulationState& state) {
    state.shift_driving_hours = 0.0;
    state.shift_on_duty_hours = 0.0;
    state.continuous_driving_hours = 0.0;
}

}  // namespace

DutyScheduleSimulator::DutyScheduleSimulator(PlannerOptions options, LocationResolverPtr resolver)
    : options_(options),
      resolver_(std::move(resolver)),
      logger_(get_logger()) {
    if (options_.current_cycle_used_hours < 0.0 || !std::isfinite(options_.current_cycle_used_hours)) {
        throw std::invalid_argument("Current cycle hours must be a non-negative number");
    }
    if (options_.days_at_reporting_location < 0) {
        throw std::invalid_argument("Days at reporting location cannot be negative");
    }
    if (resolver_ == nullptr) {
        resolver_ = std::make_shared<NullLocationResolver>();
    }
}

const PlannerOptions& DutyScheduleSimulator::options() const noexcept {
    return options_;
}

SimulationState DutyScheduleSimulator::initial_state(TimePoint start_time) const {
    const double weekly_max = weekly_max_hours(options_.weekly_mode);
    SimulationState state{};
    state.current_time = start_time;
    state.remaining_weekly_hours = std::clamp(weekly_max - options_.current_cycle_used_hours, 0.0, weekly_max);
    state.adverse_conditions_active = options_.adverse_conditions;
    state.air_mile_exception_active = options_.air_mile_exception;
    return state;
}

DutySchedule DutyScheduleSimulator::simulate(const RouteLegList& legs, TimePoint start_time) const {
    if (legs.empty()) {
        throw InsufficientInputError("Duty schedule requires at least one route leg");
    }

    DutySchedule schedule{};
    if (options_.use_split_sleeper && options_.split_sleeper_option == SplitSleeperOption::EightTwo) {
        logger_->warn("Split sleeper option 8/2 is not scheduled; using 7/3 segments");
        schedule.warnings.push_back(PlanWarning{WarningKind::UnusedSplitOption, "8/2 split requested; 7/3 segments scheduled"});
    }

    SimulationState state = initial_state(start_time);
    logger_->info("Simulating {} legs with {:.2f} h remaining in {} cycle",
                  legs.size(),
                  state.remaining_weekly_hours,
                  to_string(options_.weekly_mode));

    for (std::size_t index = 0; index < legs.size(); ++index) {
        const RouteLeg& leg = legs[index];

        PlaceLookup start_lookup = lookup_place(*resolver_, leg.start);
        if (start_lookup.warning.has_value()) {
            schedule.warnings.push_back(std::move(start_lookup.warning.value()));
        }

        if (leg.kind == LegKind::ToPickup) {
            if (!state.work_reporting_location.has_value()) {
                state.work_reporting_location = leg.start;
            }
            perform_on_duty_task(state, schedule.events, "Pre-Trip Inspection", limits::k_inspection_hours,
                                 leg.start, start_lookup.place, "Pre-trip vehicle inspection");
        } else {
            perform_on_duty_task(state, schedule.events, "Pickup", limits::k_pickup_dropoff_hours,
                                 leg.start, start_lookup.place, "Loading at pickup location");
        }

        drive_leg(leg, state, schedule.events);

        if (index + 1 == legs.size()) {
            PlaceLookup end_lookup = lookup_place(*resolver_, leg.end);
            if (end_lookup.warning.has_value()) {
                schedule.warnings.push_back(std::move(end_lookup.warning.value()));
            }
            perform_on_duty_task(state, schedule.events, "Dropoff", limits::k_pickup_dropoff_hours,
                                 leg.end, end_lookup.place, "Unloading at dropoff location");
            perform_on_duty_task(state, schedule.events, "Post-Trip Inspection", limits::k_inspection_hours,
                                 leg.end, end_lookup.place, "Post-trip vehicle inspection");
        }
    }

    assign_timeline_offsets(schedule.events);
    logger_->info("Simulated {} duty events spanning {:.2f} h ({:.1f} mi driven)",
                  schedule.events.size(),
                  schedule.events.back().end_offset_hours,
                  state.total_distance_miles);
    schedule.final_state = state;
    return schedule;
}

void DutyScheduleSimulator::drive_leg(const RouteLeg& leg, SimulationState& state, DutyEventList& events) const {
    double remaining_miles = leg.distance_miles;
    while (remaining_miles > k_distance_epsilon) {
        const Coordinate here = interpolate_along_leg(leg, remaining_miles);

        if (state.continuous_driving_hours >= limits::k_break_required_after_hours - k_hours_epsilon) {
            take_break(state, events, here);
        }

        const ShiftCeilings ceilings = shift_ceilings(state);
        if (rest_needed(state, ceilings)) {
            take_rest(state, events, here);
            continue;
        }

        const double hours_until_break = limits::k_break_required_after_hours - state.continuous_driving_hours;
        const double hours_until_shift_limit = std::min(
            ceilings.driving_hours - state.shift_driving_hours,
            ceilings.on_duty_hours - state.shift_on_duty_hours
        );
        const double hours_can_drive = std::min({hours_until_break, hours_until_shift_limit, state.remaining_weekly_hours});

        const double fueling_boundary = next_fueling_boundary(state.total_distance_miles);
        const double distance_until_fuel = fueling_boundary - state.total_distance_miles;
        const double drive_miles = std::min({remaining_miles, hours_can_drive * limits::k_average_speed_mph, distance_until_fuel});
        assert(drive_miles > 0.0);
        const double drive_hours = drive_miles / limits::k_average_speed_mph;

        DutyEvent& driving = append_event(state, events, "Driving", DutyStatus::Driving, drive_hours, here,
                                          "Driving - " + leg.description);
        driving.distance_miles = drive_miles;

        state.shift_driving_hours += drive_hours;
        state.continuous_driving_hours += drive_hours;
        state.total_distance_miles += drive_miles;
        charge_on_duty(state, driving);
        remaining_miles -= drive_miles;

        if (state.total_distance_miles + k_distance_epsilon >= fueling_boundary) {
            logger_->debug("Fueling at {:.1f} cumulative miles", state.total_distance_miles);
            perform_on_duty_task(state, events, "Fueling", limits::k_fueling_hours,
                                 interpolate_along_leg(leg, remaining_miles), std::nullopt, "Fueling stop");
        }
    }
}

void DutyScheduleSimulator::perform_on_duty_task(SimulationState& state,
                                                 DutyEventList& events,
                                                 const char* activity,
                                                 double hours,
                                                 const Coordinate& location,
                                                 const std::optional<ResolvedPlace>& place,
                                                 const char* description) const {
    // A task that would overrun the on-duty window waits for the next shift.
    while (state.shift_on_duty_hours + hours > shift_ceilings(state).on_duty_hours + k_hours_epsilon) {
        take_rest(state, events, location);
    }
    DutyEvent& task = append_event(state, events, activity, DutyStatus::OnDutyNotDriving, hours, location, description);
    task.place = place;
    charge_on_duty(state, task);
}

void DutyScheduleSimulator::take_break(SimulationState& state, DutyEventList& events, const Coordinate& location) const {
    logger_->debug("30-minute break after {:.2f} h continuous driving", state.continuous_driving_hours);
    append_event(state, events, "30-Minute Break", DutyStatus::OffDuty, limits::k_min_break_hours, location,
                 "Required 30-minute rest break");
    state.continuous_driving_hours = 0.0;
}

void DutyScheduleSimulator::take_rest(SimulationState& state, DutyEventList& events, const Coordinate& location) const {
    const double weekly_max = weekly_max_hours(options_.weekly_mode);
    const bool cycle_exhausted = state.remaining_weekly_hours <= k_hours_epsilon;

    // A shift that ran past the standard window spent this cycle's short-haul use.
    if (short_haul_eligible(state) && state.shift_on_duty_hours > limits::k_max_on_duty_hours + k_hours_epsilon) {
        ++state.short_haul_exceptions_used;
        logger_->debug("Short-haul 16-hour window consumed after {:.2f} h on duty ({} use this cycle)",
                       state.shift_on_duty_hours,
                       state.short_haul_exceptions_used);
    }

    if (options_.use_split_sleeper && !state.pending_split_segment.has_value() && !cycle_exhausted) {
        const int segment_id = state.next_segment_id++;
        logger_->debug("Split sleeper segment {} (7 h) after {:.2f} h driving", segment_id, state.shift_driving_hours);
        DutyEvent& rest = append_event(state, events, "Sleeper Berth (Split Segment 1)", DutyStatus::SleeperBerth,
                                       limits::k_split_long_segment_hours, location, "First split sleeper berth period");
        rest.rest_break = RestBreakInfo{RestBreakKind::SplitSleeperSegment1, segment_id, std::nullopt, true};
        state.pending_split_segment = segment_id;
        state.shift_driving_hours = 0.0;
        state.continuous_driving_hours = 0.0;
        return;
    }

    if (state.pending_split_segment.has_value()) {
        const int first_segment_id = state.pending_split_segment.value();
        const int segment_id = state.next_segment_id++;
        logger_->debug("Split sleeper segment {} (3 h) pairs with segment {}", segment_id, first_segment_id);
        DutyEvent& rest = append_event(state, events, "Sleeper Berth (Split Segment 2)", DutyStatus::SleeperBerth,
                                       limits::k_split_short_segment_hours, location, "Second split sleeper berth period");
        rest.rest_break = RestBreakInfo{RestBreakKind::SplitSleeperSegment2, segment_id, first_segment_id, false};

        const auto iterator_first = std::find_if(events.rbegin(), events.rend(), [first_segment_id](const DutyEvent& event) {
            return event.rest_break.has_value() && event.rest_break->segment_id == first_segment_id;
        });
        if (iterator_first != events.rend()) {
            iterator_first->rest_break->paired_segment_id = segment_id;
        }
        state.pending_split_segment.reset();
        reset_shift(state);
        return;
    }

    if (state.remaining_weekly_hours < limits::k_restart_threshold_hours) {
        logger_->debug("34-hour restart with {:.2f} h left in cycle", state.remaining_weekly_hours);
        DutyEvent& rest = append_event(state, events, "34-Hour Restart", DutyStatus::OffDuty,
                                       limits::k_restart_hours, location, "Weekly cycle restart");
        rest.rest_break = RestBreakInfo{RestBreakKind::FullRestart, state.next_segment_id++, std::nullopt, false};
        state.last_full_restart = rest.start_time;
        state.remaining_weekly_hours = weekly_max;
        state.short_haul_exceptions_used = 0;
        rest.remaining_weekly_hours = state.remaining_weekly_hours;
        reset_shift(state);
        return;
    }

    logger_->debug("10-hour rest after {:.2f} h driving, {:.2f} h on duty", state.shift_driving_hours, state.shift_on_duty_hours);
    DutyEvent& rest = append_event(state, events, "10-Hour Rest Break", DutyStatus::SleeperBerth,
                                   limits::k_min_off_duty_hours, location, "Mandatory 10-hour rest period");
    rest.rest_break = RestBreakInfo{RestBreakKind::FullRest, state.next_segment_id++, std::nullopt, false};
    reset_shift(state);
    if (!options_.any_exception_active()) {
        state.remaining_weekly_hours = std::min(weekly_max, state.remaining_weekly_hours + limits::k_min_off_duty_hours);
    }
    rest.remaining_weekly_hours = state.remaining_weekly_hours;
}

ShiftCeilings DutyScheduleSimulator::shift_ceilings(const SimulationState& state) const noexcept {
    ShiftCeilings ceilings{};
    ceilings.short_haul_applied = short_haul_eligible(state);
    ceilings.on_duty_hours = ceilings.short_haul_applied ? limits::k_short_haul_on_duty_hours : limits::k_max_on_duty_hours;
    ceilings.driving_hours = limits::k_max_driving_hours
        + (state.adverse_conditions_active ? limits::k_adverse_driving_extension_hours : 0.0);
    return ceilings;
}

bool DutyScheduleSimulator::short_haul_eligible(const SimulationState& state) const noexcept {
    return state.air_mile_exception_active
        && state.short_haul_exceptions_used < limits::k_short_haul_uses_per_cycle
        && state.work_reporting_location.has_value()
        && options_.days_at_reporting_location >= limits::k_short_haul_min_reporting_days;
}

bool DutyScheduleSimulator::rest_needed(const SimulationState& state, const ShiftCeilings& ceilings) const noexcept {
    return state.shift_driving_hours >= ceilings.driving_hours - k_hours_epsilon
        || state.shift_on_duty_hours >= ceilings.on_duty_hours - k_hours_epsilon
        || state.remaining_weekly_hours <= k_hours_epsilon;
}

}  // namespace hos_planner
