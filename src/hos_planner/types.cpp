#include "hos_planner/types.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace hos_planner {

namespace {
constexpr double k_seventy_hour_cycle{70.0};
constexpr double k_sixty_hour_cycle{60.0};
constexpr int k_eight_day_window{8};
constexpr int k_seven_day_window{7};
}  // namespace

double weekly_max_hours(WeeklyMode mode) noexcept {
    return mode == WeeklyMode::SixtySeven ? k_sixty_hour_cycle : k_seventy_hour_cycle;
}

int weekly_window_days(WeeklyMode mode) noexcept {
    return mode == WeeklyMode::SixtySeven ? k_seven_day_window : k_eight_day_window;
}

WeeklyMode parse_weekly_mode(std::string_view text) {
    if (text == "70/8") {
        return WeeklyMode::SeventyEight;
    }
    if (text == "60/7") {
        return WeeklyMode::SixtySeven;
    }
    throw std::invalid_argument(fmt::format("Unknown weekly mode '{}'; expected 70/8 or 60/7", text));
}

SplitSleeperOption parse_split_sleeper_option(std::string_view text) {
    if (text == "7/3") {
        return SplitSleeperOption::SevenThree;
    }
    if (text == "8/2") {
        return SplitSleeperOption::EightTwo;
    }
    throw std::invalid_argument(fmt::format("Unknown split sleeper option '{}'; expected 7/3 or 8/2", text));
}

std::string_view to_string(DutyStatus status) noexcept {
    switch (status) {
        case DutyStatus::OffDuty:
            return "off_duty";
        case DutyStatus::SleeperBerth:
            return "sleeper_berth";
        case DutyStatus::Driving:
            return "driving";
        case DutyStatus::OnDutyNotDriving:
            return "on_duty_not_driving";
    }
    return "unknown";
}

std::string_view to_string(WeeklyMode mode) noexcept {
    return mode == WeeklyMode::SixtySeven ? "60/7" : "70/8";
}

std::string_view to_string(SplitSleeperOption option) noexcept {
    return option == SplitSleeperOption::EightTwo ? "8/2" : "7/3";
}

SystemClock::duration to_clock_duration(double hours) {
    return std::chrono::duration_cast<SystemClock::duration>(Hours{hours});
}

TimePoint start_of_day(TimePoint time_point) {
    return std::chrono::floor<std::chrono::days>(time_point);
}

std::string format_date(TimePoint time_point) {
    const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(time_point)};
    return fmt::format("{:04}-{:02}-{:02}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

std::string format_timestamp(TimePoint time_point) {
    const auto day_start = std::chrono::floor<std::chrono::days>(time_point);
    const auto minutes_into_day = std::chrono::floor<std::chrono::minutes>(time_point - day_start);
    const std::chrono::hh_mm_ss<std::chrono::minutes> time_of_day{minutes_into_day};
    return fmt::format("{}T{:02}:{:02}",
                       format_date(time_point),
                       time_of_day.hours().count(),
                       time_of_day.minutes().count());
}

}  // namespace hos_planner
