// === Route Legs ==============================================================
//
// Normalizes routed (or estimated) leg figures plus the three trip waypoints
// into the ordered leg list the duty schedule simulator consumes.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "hos_planner/types.hpp"

namespace hos_planner {

/** @brief Which part of the trip a leg covers. */
enum class LegKind {
    ToPickup,   /**< Current location to pickup. */
    ToDropoff   /**< Pickup to dropoff. */
};

/** @brief Distance/duration for one leg as reported by a routing provider. */
struct LegEstimate final {
    double distance_miles{};  /**< Routed distance in miles. */
    double duration_hours{};  /**< Nominal travel time in hours (informational). */
};

/** @brief One typed leg of the trip. */
struct RouteLeg final {
    Coordinate start{};
    Coordinate end{};
    double distance_miles{};
    double duration_hours{};
    LegKind kind{LegKind::ToPickup};
    std::string description{};
};

using RouteLegList = std::vector<RouteLeg>;

/** @brief Great-circle distance between two coordinates in miles. */
[[nodiscard]] double haversine_distance_miles(const Coordinate& from, const Coordinate& to);

/** @brief Straight-line fallback used when no routed estimate is available. */
[[nodiscard]] LegEstimate estimate_straight_line_leg(const Coordinate& from, const Coordinate& to);

/**
 * @brief Assemble the ordered leg list for a current -> pickup -> dropoff trip.
 *
 * @param allow_straight_line_fallback Estimate absent legs from coordinates
 *        instead of omitting them.
 * @throws InsufficientInputError when no leg remains.
 * @throws std::invalid_argument on negative distances or durations.
 */
[[nodiscard]] RouteLegList build_route_legs(
    const Coordinate& current,
    const Coordinate& pickup,
    const Coordinate& dropoff,
    const std::optional<LegEstimate>& leg_to_pickup,
    const std::optional<LegEstimate>& leg_to_dropoff,
    bool allow_straight_line_fallback = false
);

[[nodiscard]] std::string_view to_string(LegKind kind) noexcept;

}  // namespace hos_planner
