#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "hos_planner/configuration.hpp"
#include "hos_planner/logging.hpp"
#include "hos_planner/rolling_hours_tracker.hpp"
#include "hos_planner/trip_planner.hpp"
#include "hos_planner/version.hpp"

namespace {

constexpr char k_usage[] =
    "usage: hos_trip_planner <lat,lon> <lat,lon> <lat,lon> [leg1_miles leg1_hours leg2_miles leg2_hours]";

hos_planner::Coordinate parse_coordinate(std::string_view text) {
    const std::size_t comma = text.find(',');
    if (comma == std::string_view::npos) {
        throw std::invalid_argument("Coordinate '" + std::string{text} + "' must be written as lat,lon");
    }
    const double latitude = std::stod(std::string{text.substr(0, comma)});
    const double longitude = std::stod(std::string{text.substr(comma + 1)});
    if (latitude < -90.0 || latitude > 90.0 || longitude < -180.0 || longitude > 180.0) {
        throw std::invalid_argument("Coordinate '" + std::string{text} + "' is out of range");
    }
    return hos_planner::Coordinate{latitude, longitude};
}

void log_plan(const hos_planner::TripPlan& plan) {
    using namespace hos_planner;
    auto logger = get_logger();

    for (const DutyEvent& event : plan.events) {
        logger->info("{:>7.2f}h  {}  {:<32} {:<20} {:>5.2f}h{}",
                     event.start_offset_hours,
                     format_timestamp(event.start_time),
                     event.activity,
                     to_string(event.status),
                     event.duration_hours,
                     event.distance_miles.has_value() ? fmt::format("  {:.1f} mi", *event.distance_miles)
                     : event.rest_break.has_value()   ? fmt::format("  [{}]", to_string(event.rest_break->kind))
                                                      : std::string{});
    }

    for (const DailyLog& log : plan.daily_logs) {
        logger->info("Daily log {}: driving={:.2f}h on_duty={:.2f}h off_duty={:.2f}h sleeper={:.2f}h miles={:.1f}",
                     format_date(log.date),
                     log.total_driving_hours,
                     log.total_on_duty_hours,
                     log.total_off_duty_hours,
                     log.total_sleeper_hours,
                     log.total_miles);
    }

    logger->info("Compliance: {} ({} shifts, {} violations)",
                 plan.compliance.compliant ? "compliant" : "non-compliant",
                 plan.compliance.total_shifts,
                 plan.compliance.violations.size());
    logger->info("Summary: {} -> {} | {:.1f} h total, {:.1f} h driving, {:.1f} h on duty, {:.1f} h rest, {} stops, {} rest breaks",
                 format_timestamp(plan.summary.start_time),
                 format_timestamp(plan.summary.end_time),
                 plan.summary.total_duration_hours,
                 plan.summary.total_driving_hours,
                 plan.summary.total_on_duty_hours,
                 plan.summary.total_rest_hours,
                 plan.summary.number_of_stops,
                 plan.summary.rest_breaks);
    for (const PlanWarning& warning : plan.warnings) {
        logger->warn("Plan warning: {}", warning.detail);
    }
}

void log_rolling_hours(const hos_planner::Configuration& configuration) {
    using namespace hos_planner;
    auto logger = get_logger();
    try {
        const DutyHistoryParseResult history = load_duty_history(configuration.history_file.value());
        const RollingHoursSummary summary = rolling_hours(history.entries, configuration.planner.weekly_mode);
        logger->info("Rolling hours ({}): used={:.2f}h available={:.2f}h over {} days ({} records recovered or skipped)",
                     to_string(summary.weekly_mode),
                     summary.hours_used,
                     summary.hours_available,
                     summary.daily_breakdown.size(),
                     history.warnings.size());
    } catch (const NoValidLogsError& exc) {
        logger->warn("Rolling hours unavailable: {}", exc.what());
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace hos_planner;

    if (argc != 4 && argc != 8) {
        std::cerr << k_usage << '\n';
        return EXIT_FAILURE;
    }

    try {
        const Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);
        get_logger()->info("hos_trip_planner {}", k_version);

        TripRequest request{};
        request.current_location = parse_coordinate(argv[1]);
        request.pickup_location = parse_coordinate(argv[2]);
        request.dropoff_location = parse_coordinate(argv[3]);
        if (argc == 8) {
            request.leg_to_pickup = LegEstimate{std::stod(argv[4]), std::stod(argv[5])};
            request.leg_to_dropoff = LegEstimate{std::stod(argv[6]), std::stod(argv[7])};
        } else {
            request.allow_straight_line_fallback = true;
        }
        request.options = configuration.planner;
        request.start_time = SystemClock::now();

        auto resolver = std::make_shared<TimeoutLocationResolver>(
            std::make_shared<NullLocationResolver>(),
            configuration.resolver_timeout
        );
        const TripPlan plan = calculate_trip_plan(request, resolver);
        log_plan(plan);

        if (configuration.history_file.has_value()) {
            log_rolling_hours(configuration);
        }
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
