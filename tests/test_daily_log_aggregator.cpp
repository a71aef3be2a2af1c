#include <chrono>
#include <optional>
#include <string>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "trip_fixtures.hpp"
#include "hos_planner/daily_log_aggregator.hpp"
#include "hos_planner/duty_schedule_simulator.hpp"

using namespace hos_planner;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    hos_planner::test::ensure_logger_initialized();
    return true;
}();

DutyEvent make_event(DutyStatus status, TimePoint start_time, double hours, std::optional<double> miles = std::nullopt) {
    DutyEvent event{};
    event.activity = std::string{to_string(status)};
    event.status = status;
    event.start_time = start_time;
    event.duration_hours = hours;
    event.distance_miles = miles;
    return event;
}
}  // namespace

TEST_CASE("Events are bucketed by the calendar day they start on") {
    const TimePoint day_one = TimePoint{std::chrono::sys_days{std::chrono::year{2024} / 3 / 4}};
    DutyEventList events{};
    events.push_back(make_event(DutyStatus::OnDutyNotDriving, day_one + std::chrono::hours{20}, 0.25));
    events.push_back(make_event(DutyStatus::Driving, day_one + std::chrono::hours{20} + std::chrono::minutes{15}, 2.0, 120.0));
    events.push_back(make_event(DutyStatus::SleeperBerth, day_one + std::chrono::hours{22} + std::chrono::minutes{15}, 10.0));
    events.push_back(make_event(DutyStatus::Driving, day_one + std::chrono::hours{32} + std::chrono::minutes{15}, 3.0, 180.0));
    events.push_back(make_event(DutyStatus::OffDuty, day_one + std::chrono::hours{35} + std::chrono::minutes{15}, 0.5));

    const DailyLogList logs = aggregate_daily_logs(events);

    REQUIRE(logs.size() == 2);
    CHECK(logs[0].date == day_one);
    CHECK(format_date(logs[1].date) == "2024-03-05");

    // The overnight rest belongs entirely to the day it started on.
    CHECK(logs[0].events.size() == 3);
    CHECK(logs[0].total_sleeper_hours == Approx(10.0));
    CHECK(logs[0].total_driving_hours == Approx(2.0));
    CHECK(logs[0].total_on_duty_hours == Approx(0.25));
    CHECK(logs[0].total_miles == Approx(120.0));
    CHECK(logs[0].total_hours() == Approx(12.25));

    CHECK(logs[1].events.size() == 2);
    CHECK(logs[1].total_driving_hours == Approx(3.0));
    CHECK(logs[1].total_off_duty_hours == Approx(0.5));
    CHECK(logs[1].total_sleeper_hours == Approx(0.0));
    CHECK(logs[1].total_miles == Approx(180.0));
}

TEST_CASE("Daily totals account for every simulated event exactly once") {
    const DutyScheduleSimulator simulator{PlannerOptions{}};
    const TimePoint evening = TimePoint{std::chrono::sys_days{std::chrono::year{2024} / 3 / 4}} + std::chrono::hours{20};
    const DutySchedule schedule = simulator.simulate(test::make_legs(250.0, 1750.0), evening);

    const DailyLogList logs = aggregate_daily_logs(schedule.events);
    REQUIRE(logs.size() >= 3);

    std::size_t bucketed_events = 0;
    double bucketed_hours = 0.0;
    for (std::size_t index = 0; index < logs.size(); ++index) {
        const DailyLog& log = logs[index];
        if (index > 0) {
            CHECK(logs[index - 1].date < log.date);
        }

        double driving = 0.0;
        double on_duty = 0.0;
        double off_duty = 0.0;
        double sleeper = 0.0;
        double miles = 0.0;
        for (const DutyEvent& event : log.events) {
            CHECK(start_of_day(event.start_time) == log.date);
            switch (event.status) {
                case DutyStatus::Driving:
                    driving += event.duration_hours;
                    miles += event.distance_miles.value_or(0.0);
                    break;
                case DutyStatus::OnDutyNotDriving:
                    on_duty += event.duration_hours;
                    break;
                case DutyStatus::OffDuty:
                    off_duty += event.duration_hours;
                    break;
                case DutyStatus::SleeperBerth:
                    sleeper += event.duration_hours;
                    break;
            }
        }
        CHECK(log.total_driving_hours == Approx(driving));
        CHECK(log.total_on_duty_hours == Approx(on_duty));
        CHECK(log.total_off_duty_hours == Approx(off_duty));
        CHECK(log.total_sleeper_hours == Approx(sleeper));
        CHECK(log.total_miles == Approx(miles));

        bucketed_events += log.events.size();
        bucketed_hours += log.total_hours();
    }

    CHECK(bucketed_events == schedule.events.size());
    CHECK(bucketed_hours == Approx(schedule.events.back().end_offset_hours));
}

TEST_CASE("Empty timeline yields no daily logs") {
    CHECK(aggregate_daily_logs(DutyEventList{}).empty());
}

TEST_CASE("Log days begin at 00:00 UTC") {
    const TimePoint midnight_utc = TimePoint{std::chrono::sys_days{std::chrono::year{2024} / 3 / 4}};
    DutyEventList events{};
    events.push_back(make_event(DutyStatus::Driving, midnight_utc - std::chrono::minutes{1}, 0.5, 30.0));
    events.push_back(make_event(DutyStatus::OnDutyNotDriving, midnight_utc + std::chrono::minutes{29}, 1.0));

    const DailyLogList logs = aggregate_daily_logs(events);

    REQUIRE(logs.size() == 2);
    CHECK(format_timestamp(logs[0].date) == "2024-03-03T00:00");
    CHECK(format_timestamp(logs[1].date) == "2024-03-04T00:00");
    CHECK(logs[1].date == midnight_utc);
    CHECK(logs[0].total_driving_hours == Approx(0.5));
    CHECK(logs[1].total_on_duty_hours == Approx(1.0));
}
