#include <memory>
#include <string>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "trip_fixtures.hpp"
#include "hos_planner/trip_planner.hpp"

using namespace hos_planner;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    hos_planner::test::ensure_logger_initialized();
    return true;
}();

TripRequest make_request(double to_pickup_miles, double to_dropoff_miles) {
    TripRequest request{};
    request.current_location = test::k_current;
    request.pickup_location = test::k_pickup;
    request.dropoff_location = test::k_dropoff;
    request.leg_to_pickup = LegEstimate{to_pickup_miles, to_pickup_miles / 55.0};
    request.leg_to_dropoff = LegEstimate{to_dropoff_miles, to_dropoff_miles / 55.0};
    request.start_time = test::monday_morning();
    return request;
}

class CityResolver final : public LocationResolver {
  public:
    std::string resolve(const Coordinate&) override {
        return "500 Main St, Louisville, KY";
    }
};
}  // namespace

TEST_CASE("Short trip plans end to end within one shift") {
    const TripPlan plan = calculate_trip_plan(make_request(100.0, 100.0));

    CHECK(plan.total_distance_miles == Approx(200.0));
    CHECK(plan.total_driving_hours == Approx(200.0 / 55.0));
    REQUIRE(plan.legs.size() == 2);
    REQUIRE(plan.events.size() == 6);
    CHECK(plan.events.front().activity == "Pre-Trip Inspection");
    CHECK(plan.events.back().activity == "Post-Trip Inspection");
    CHECK(plan.total_elapsed_hours == Approx(0.25 + 100.0 / 60.0 + 1.0 + 100.0 / 60.0 + 1.0 + 0.25));
    CHECK(plan.warnings.empty());

    REQUIRE(plan.daily_logs.size() == 1);
    CHECK(format_date(plan.daily_logs.front().date) == "2024-03-04");
    CHECK(plan.daily_logs.front().total_miles == Approx(200.0));

    CHECK(plan.compliance.compliant);
    CHECK(plan.compliance.total_shifts == 0);

    const TripSummary& summary = plan.summary;
    CHECK(summary.start_time == test::monday_morning());
    CHECK(summary.total_duration_hours == Approx(plan.total_elapsed_hours));
    CHECK(summary.end_time == test::monday_morning() + to_clock_duration(plan.total_elapsed_hours));
    CHECK(summary.total_driving_hours == Approx(200.0 / 60.0));
    CHECK(summary.total_on_duty_hours == Approx(plan.total_elapsed_hours));
    CHECK(summary.total_rest_hours == Approx(0.0));
    CHECK(summary.number_of_stops == 0);
    CHECK(summary.rest_breaks == 0);
}

TEST_CASE("Long baseline trip stays compliant and counts its stops") {
    const TripPlan plan = calculate_trip_plan(make_request(350.0, 2150.0));

    CHECK(plan.compliance.compliant);
    CHECK(plan.compliance.total_shifts == 3);
    CHECK(plan.daily_logs.size() >= 3);

    const TripSummary& summary = plan.summary;
    CHECK(test::count_activity(plan.events, "Fueling") == 2);
    CHECK(summary.number_of_stops
          == static_cast<int>(test::count_activity(plan.events, "Fueling") + test::count_activity(plan.events, "30-Minute Break")));
    CHECK(summary.rest_breaks == 3);
    CHECK(test::count_rest_kind(plan.events, RestBreakKind::FullRest) == 3);
    CHECK(summary.total_driving_hours == Approx(2500.0 / 60.0));
    CHECK(summary.total_on_duty_hours + summary.total_rest_hours == Approx(summary.total_duration_hours));
}

TEST_CASE("Missing leg figures use the straight-line fallback when allowed") {
    TripRequest request = make_request(0.0, 0.0);
    request.leg_to_pickup.reset();
    request.leg_to_dropoff.reset();

    SECTION("fallback disabled") {
        CHECK_THROWS_AS(calculate_trip_plan(request), InsufficientInputError);
    }

    SECTION("fallback enabled") {
        request.allow_straight_line_fallback = true;
        const TripPlan plan = calculate_trip_plan(request);
        REQUIRE(plan.legs.size() == 2);
        const double expected_miles = haversine_distance_miles(test::k_current, test::k_pickup)
            + haversine_distance_miles(test::k_pickup, test::k_dropoff);
        CHECK(plan.total_distance_miles == Approx(expected_miles));
        CHECK(plan.total_driving_hours == Approx(expected_miles / 55.0));
    }
}

TEST_CASE("Resolved places and warnings flow into the plan") {
    SECTION("resolver supplies places") {
        const TripPlan plan = calculate_trip_plan(make_request(100.0, 100.0), std::make_shared<CityResolver>());
        REQUIRE(plan.events.front().place.has_value());
        CHECK(plan.events.front().place->city == "Louisville");
        CHECK(plan.events.front().place->region == "KY");
        CHECK(plan.warnings.empty());
    }

    SECTION("unused split option is reported") {
        TripRequest request = make_request(100.0, 100.0);
        request.options.use_split_sleeper = true;
        request.options.split_sleeper_option = SplitSleeperOption::EightTwo;
        const TripPlan plan = calculate_trip_plan(request);
        REQUIRE(plan.warnings.size() == 1);
        CHECK(plan.warnings.front().kind == WarningKind::UnusedSplitOption);
    }
}

TEST_CASE("Summaries of an empty timeline are zeroed") {
    const TripSummary summary = summarize_trip(DutyEventList{}, test::monday_morning());
    CHECK(summary.start_time == summary.end_time);
    CHECK(summary.total_duration_hours == Approx(0.0));
    CHECK(summary.number_of_stops == 0);
}
