// === Duty Events =============================================================
//
// A duty event is one contiguous interval on the trip timeline. Every event
// carries exactly one regulatory DutyStatus; rest periods additionally carry
// RestBreakInfo describing which rest provision produced them.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "hos_planner/location_resolver.hpp"
#include "hos_planner/types.hpp"

namespace hos_planner {

/** @brief Rest provision that produced a rest event. */
enum class RestBreakKind {
    SplitSleeperSegment1,  /**< Longer sleeper segment of a split pair. */
    SplitSleeperSegment2,  /**< Shorter segment completing a split pair. */
    FullRestart,           /**< 34-hour weekly restart. */
    FullRest               /**< Standard 10-hour rest. */
};

/** @brief Metadata attached to rest events only. */
struct RestBreakInfo final {
    RestBreakKind kind{RestBreakKind::FullRest};
    int segment_id{};                          /**< Unique per simulation. */
    std::optional<int> paired_segment_id{};    /**< Other half of a split pair. */
    bool excluded_from_window{};               /**< Does not count toward the 14-hour window. */
};

/** @brief One interval of the duty timeline. */
struct DutyEvent final {
    std::string activity{};                    /**< Free-text label, e.g. "30-Minute Break". */
    DutyStatus status{DutyStatus::OffDuty};
    TimePoint start_time{};
    double duration_hours{};
    std::optional<double> distance_miles{};    /**< Present on Driving events only. */
    Coordinate location{};
    std::optional<ResolvedPlace> place{};
    std::string description{};
    std::optional<RestBreakInfo> rest_break{};
    double remaining_weekly_hours{};           /**< Weekly-cycle hours left once the event ends. */
    double start_offset_hours{};               /**< Assigned once the timeline is final. */
    double end_offset_hours{};

    [[nodiscard]] TimePoint end_time() const;
    [[nodiscard]] bool is_on_duty() const noexcept;
};

using DutyEventList = std::vector<DutyEvent>;

[[nodiscard]] std::string_view to_string(RestBreakKind kind) noexcept;

/** @brief Assign contiguous cumulative start/end offsets in list order. */
void assign_timeline_offsets(DutyEventList& events);

}  // namespace hos_planner
