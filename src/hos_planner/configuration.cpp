// === Configuration Loader ====================================================
//
// Reads the HOS_PLANNER_* environment variables into a Configuration. Weekly
// mode, cycle hours and exception flags become the default PlannerOptions for
// every plan the application runs; the log and resolver settings are applied
// once at startup.
//
// Malformed values never abort startup: each helper logs a warning and keeps
// the documented default. Cycle hours above the weekly maximum are clamped.

#include "hos_planner/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "hos_planner/logging.hpp"

namespace hos_planner {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};
constexpr int k_default_resolver_timeout_ms{2000};

double parse_hours(const char* raw_value, double fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (parsed_value < 0.0 || !std::isfinite(parsed_value)) {
            get_logger()->warn("Invalid hours {} in environment; using fallback {}", parsed_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse hours from environment; using fallback {}", fallback);
        return fallback;
    }
}

int parse_int(const char* raw_value, int fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        return parsed_value < 0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse integer from environment; using fallback {}", fallback);
        return fallback;
    }
}

bool parse_flag(const char* raw_value, bool fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    std::string lowered{raw_value};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    get_logger()->warn("Unrecognized boolean '{}' in environment; using fallback {}", raw_value, fallback);
    return fallback;
}

WeeklyMode parse_mode(const char* raw_value) {
    if (raw_value == nullptr) {
        return WeeklyMode::SeventyEight;
    }
    try {
        return parse_weekly_mode(raw_value);
    } catch (const std::invalid_argument& exc) {
        get_logger()->warn("{}; defaulting to 70/8", exc.what());
        return WeeklyMode::SeventyEight;
    }
}

SplitSleeperOption parse_split_option(const char* raw_value) {
    if (raw_value == nullptr) {
        return SplitSleeperOption::SevenThree;
    }
    try {
        return parse_split_sleeper_option(raw_value);
    } catch (const std::invalid_argument& exc) {
        get_logger()->warn("{}; defaulting to 7/3", exc.what());
        return SplitSleeperOption::SevenThree;
    }
}

std::string parse_string(const char* variable_name, std::string_view fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("HOS_PLANNER_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string("HOS_PLANNER_LOG_LEVEL", k_default_log_level);
    config.planner = load_planner_options();
    config.resolver_timeout = std::chrono::milliseconds{
        parse_int(std::getenv("HOS_PLANNER_RESOLVER_TIMEOUT_MS"), k_default_resolver_timeout_ms)
    };
    if (config.resolver_timeout.count() == 0) {
        config.resolver_timeout = std::chrono::milliseconds{k_default_resolver_timeout_ms};
    }

    const std::string history_file = parse_string("HOS_PLANNER_HISTORY_FILE", "");
    if (!history_file.empty()) {
        config.history_file = std::filesystem::path{history_file};
    }

    logger->info("Configuration loaded: weekly_mode={} cycle_used_h={} split_sleeper={} adverse={} air_mile={} resolver_timeout_ms={}",
                 to_string(config.planner.weekly_mode),
                 config.planner.current_cycle_used_hours,
                 config.planner.use_split_sleeper,
                 config.planner.adverse_conditions,
                 config.planner.air_mile_exception,
                 config.resolver_timeout.count());

    return config;
}

PlannerOptions ConfigurationLoader::load_planner_options() {
    PlannerOptions options{};
    options.weekly_mode = parse_mode(std::getenv("HOS_PLANNER_WEEKLY_MODE"));
    options.current_cycle_used_hours = parse_hours(std::getenv("HOS_PLANNER_CYCLE_USED_HOURS"), 0.0);
    options.use_split_sleeper = parse_flag(std::getenv("HOS_PLANNER_SPLIT_SLEEPER"), false);
    options.split_sleeper_option = parse_split_option(std::getenv("HOS_PLANNER_SPLIT_OPTION"));
    options.adverse_conditions = parse_flag(std::getenv("HOS_PLANNER_ADVERSE_CONDITIONS"), false);
    options.air_mile_exception = parse_flag(std::getenv("HOS_PLANNER_AIR_MILE_EXCEPTION"), false);
    options.days_at_reporting_location = parse_int(std::getenv("HOS_PLANNER_REPORTING_DAYS"), 0);

    const double weekly_max = weekly_max_hours(options.weekly_mode);
    if (options.current_cycle_used_hours > weekly_max) {
        get_logger()->warn("Cycle hours {} exceed the {} h maximum; clamping", options.current_cycle_used_hours, weekly_max);
        options.current_cycle_used_hours = weekly_max;
    }
    return options;
}

}  // namespace hos_planner
