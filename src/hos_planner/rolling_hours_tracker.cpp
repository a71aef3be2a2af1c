#include "hos_planner/rolling_hours_tracker.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <numeric>
#include <optional>
#include <stdexcept>

#include <fmt/format.h>

#include "hos_planner/logging.hpp"

namespace hos_planner {

namespace {

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

template <typename Number>
std::optional<Number> parse_number(std::string_view text) {
    Number value{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, error] = std::from_chars(first, last, value);
    if (error != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::optional<TimePoint> parse_date(std::string_view text) {
    text = trim(text);
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    const auto year = parse_number<int>(text.substr(0, 4));
    const auto month = parse_number<unsigned>(text.substr(5, 2));
    const auto day = parse_number<unsigned>(text.substr(8, 2));
    if (!year || !month || !day) {
        return std::nullopt;
    }
    const std::chrono::year_month_day ymd{std::chrono::year{*year}, std::chrono::month{*month}, std::chrono::day{*day}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return TimePoint{std::chrono::sys_days{ymd}};
}

RollingHoursSummary rolling_hours(DutyHistory history, WeeklyMode mode) {
    std::stable_sort(history.begin(), history.end(), [](const DutyHistoryEntry& lhs, const DutyHistoryEntry& rhs) {
        return lhs.date < rhs.date;
    });

    const auto window_days = static_cast<std::size_t>(weekly_window_days(mode));
    if (history.size() > window_days) {
        history.erase(history.begin(), history.end() - static_cast<std::ptrdiff_t>(window_days));
    }

    RollingHoursSummary summary{};
    summary.weekly_mode = mode;
    summary.hours_used = std::accumulate(history.begin(), history.end(), 0.0, [](double total, const DutyHistoryEntry& entry) {
        return total + entry.on_duty_hours;
    });
    summary.hours_available = std::max(0.0, weekly_max_hours(mode) - summary.hours_used);
    summary.daily_breakdown = std::move(history);
    return summary;
}

DutyHistoryParseResult parse_duty_history(const std::vector<std::string>& lines) {
    DutyHistoryParseResult result{};
    auto logger = get_logger();
    std::size_t record_count = 0;

    for (std::size_t line_index = 0; line_index < lines.size(); ++line_index) {
        const std::string_view line = trim(lines[line_index]);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        ++record_count;
        const std::size_t line_number = line_index + 1;

        const std::size_t comma = line.find(',');
        const std::string_view date_field = comma == std::string_view::npos ? line : line.substr(0, comma);
        const std::string_view hours_field = comma == std::string_view::npos ? std::string_view{} : trim(line.substr(comma + 1));

        const auto hours = parse_number<double>(hours_field);
        if (!hours.has_value() || *hours < 0.0 || !std::isfinite(*hours)) {
            const std::string detail = fmt::format("line {}: unusable hours '{}'", line_number, hours_field);
            logger->warn("Skipping duty history record, {}", detail);
            result.warnings.push_back(PlanWarning{WarningKind::SkippedHistoryRecord, detail});
            continue;
        }

        std::optional<TimePoint> date = parse_date(date_field);
        if (!date.has_value()) {
            if (result.entries.empty()) {
                const std::string detail = fmt::format("line {}: unparseable date '{}'", line_number, date_field);
                logger->warn("Skipping duty history record, {}", detail);
                result.warnings.push_back(PlanWarning{WarningKind::SkippedHistoryRecord, detail});
                continue;
            }
            date = result.entries.back().date + std::chrono::days{1};
            const std::string detail = fmt::format("line {}: unparseable date '{}' replaced by {}", line_number, date_field, format_date(*date));
            logger->warn("Recovered duty history record, {}", detail);
            result.warnings.push_back(PlanWarning{WarningKind::SubstitutedHistoryDate, detail});
        }

        result.entries.push_back(DutyHistoryEntry{*date, *hours});
    }

    if (record_count > 0 && result.entries.empty()) {
        throw NoValidLogsError(fmt::format("None of the {} duty history records could be parsed", record_count));
    }
    return result;
}

DutyHistoryParseResult load_duty_history(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream) {
        throw std::runtime_error("Unable to open duty history file " + path.string());
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    get_logger()->info("Read {} lines of duty history from {}", lines.size(), path.string());
    return parse_duty_history(lines);
}

}  // namespace hos_planner
