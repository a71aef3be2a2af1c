#include <chrono>
#include <string>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "trip_fixtures.hpp"
#include "hos_planner/compliance_checker.hpp"
#include "hos_planner/duty_schedule_simulator.hpp"

using namespace hos_planner;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    hos_planner::test::ensure_logger_initialized();
    return true;
}();

/** @brief Appends events back to back starting at the fixture's Monday morning. */
class TimelineBuilder final {
  public:
    TimelineBuilder& add(DutyStatus status, double hours) {
        DutyEvent event{};
        event.activity = std::string{to_string(status)};
        event.status = status;
        event.start_time = cursor_;
        event.duration_hours = hours;
        cursor_ += to_clock_duration(hours);
        events_.push_back(event);
        return *this;
    }

    [[nodiscard]] const DutyEventList& events() const noexcept {
        return events_;
    }

  private:
    TimePoint cursor_{test::monday_morning()};
    DutyEventList events_{};
};
}  // namespace

TEST_CASE("Ten-hour rests close shifts and the open tail is not audited") {
    TimelineBuilder builder{};
    builder.add(DutyStatus::OnDutyNotDriving, 0.25)
        .add(DutyStatus::Driving, 8.0)
        .add(DutyStatus::OffDuty, 0.5)
        .add(DutyStatus::Driving, 3.0)
        .add(DutyStatus::SleeperBerth, 10.0)
        .add(DutyStatus::Driving, 4.0)
        .add(DutyStatus::OnDutyNotDriving, 1.0);

    const ComplianceReport report = check_compliance(builder.events());

    CHECK(report.compliant);
    CHECK(report.violations.empty());
    REQUIRE(report.total_shifts == 1);
    CHECK(report.shifts[0].driving_hours == Approx(11.0));
    CHECK(report.shifts[0].on_duty_hours == Approx(11.25));
    CHECK(report.shifts[0].start_time == test::monday_morning());

    SECTION("closing the tail adds a second shift") {
        builder.add(DutyStatus::OffDuty, 10.0);
        const ComplianceReport closed = check_compliance(builder.events());
        REQUIRE(closed.total_shifts == 2);
        CHECK(closed.shifts[1].driving_hours == Approx(4.0));
        CHECK(closed.shifts[1].on_duty_hours == Approx(5.0));
    }
}

TEST_CASE("Overruns in an unclosed shift are not reported") {
    TimelineBuilder builder{};
    builder.add(DutyStatus::Driving, 12.0).add(DutyStatus::OnDutyNotDriving, 3.0);

    const ComplianceReport report = check_compliance(builder.events());
    CHECK(report.total_shifts == 0);
    CHECK(report.compliant);
}

TEST_CASE("Driving and on-duty overruns are reported per shift") {
    TimelineBuilder builder{};
    builder.add(DutyStatus::Driving, 8.0)
        .add(DutyStatus::OffDuty, 0.5)
        .add(DutyStatus::Driving, 4.0)
        .add(DutyStatus::OnDutyNotDriving, 3.0)
        .add(DutyStatus::SleeperBerth, 10.0)
        .add(DutyStatus::Driving, 2.0);

    const ComplianceReport report = check_compliance(builder.events());

    CHECK_FALSE(report.compliant);
    CHECK(report.total_shifts == 1);
    REQUIRE(report.violations.size() == 2);
    CHECK(report.violations[0].rfind("Shift 1: Exceeded 11-hour driving limit", 0) == 0);
    CHECK(report.violations[1].rfind("Shift 1: Exceeded 14-hour on-duty limit", 0) == 0);
}

TEST_CASE("Short rests do not close a shift") {
    TimelineBuilder builder{};
    builder.add(DutyStatus::Driving, 8.0)
        .add(DutyStatus::SleeperBerth, 7.0)
        .add(DutyStatus::Driving, 3.0)
        .add(DutyStatus::SleeperBerth, 3.0)
        .add(DutyStatus::Driving, 2.0)
        .add(DutyStatus::SleeperBerth, 10.0);

    const ComplianceReport report = check_compliance(builder.events());

    CHECK(report.total_shifts == 1);
    CHECK(report.shifts[0].driving_hours == Approx(13.0));
    CHECK_FALSE(report.compliant);
}

TEST_CASE("Leading rest does not create an empty shift") {
    TimelineBuilder builder{};
    builder.add(DutyStatus::OffDuty, 34.0).add(DutyStatus::Driving, 2.0).add(DutyStatus::SleeperBerth, 10.0);

    const ComplianceReport report = check_compliance(builder.events());
    CHECK(report.total_shifts == 1);
    CHECK(report.compliant);
    CHECK(check_compliance(DutyEventList{}).total_shifts == 0);
}

TEST_CASE("Baseline simulated timelines pass the audit") {
    const DutyScheduleSimulator simulator{PlannerOptions{}};
    const DutySchedule schedule = simulator.simulate(test::make_legs(350.0, 2150.0), test::monday_morning());

    const ComplianceReport report = check_compliance(schedule.events);
    CHECK(report.compliant);
    CHECK(report.total_shifts == 3);
    for (const ShiftTotals& shift : report.shifts) {
        CHECK(shift.driving_hours <= 11.0 + 1e-6);
        CHECK(shift.on_duty_hours <= 14.0 + 1e-6);
    }
}

TEST_CASE("Baseline audit of exception timelines") {
    SECTION("split sleeper segments never close a shift") {
        PlannerOptions options{};
        options.use_split_sleeper = true;
        const DutySchedule schedule = DutyScheduleSimulator{options}.simulate(test::make_legs(100.0, 1200.0), test::monday_morning());
        const ComplianceReport report = check_compliance(schedule.events);
        CHECK(report.total_shifts == 0);
        CHECK(report.compliant);
    }

    SECTION("adverse conditions") {
        PlannerOptions options{};
        options.adverse_conditions = true;
        const DutySchedule schedule = DutyScheduleSimulator{options}.simulate(test::make_dropoff_only_leg(900.0), test::monday_morning());
        const ComplianceReport report = check_compliance(schedule.events);
        CHECK_FALSE(report.compliant);
        CHECK(report.shifts.front().driving_hours == Approx(13.0));
    }
}
