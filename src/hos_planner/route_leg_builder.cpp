#include "hos_planner/route_leg_builder.hpp"

#include <cmath>
#include <numbers>
#include <stdexcept>

#include "hos_planner/errors.hpp"
#include "hos_planner/logging.hpp"

namespace hos_planner {

namespace {

constexpr double k_earth_radius_miles{3'959.0};       /**< Mean Earth radius in statute miles. */
constexpr double k_fallback_speed_mph{55.0};          /**< Assumed speed when estimating without a router. */
constexpr char k_to_pickup_description[] = "Current Location to Pickup";
constexpr char k_to_dropoff_description[] = "Pickup to Dropoff";

void validate_estimate(const LegEstimate& estimate, const char* leg_name) {
    if (estimate.distance_miles < 0.0 || !std::isfinite(estimate.distance_miles)) {
        throw std::invalid_argument(std::string{leg_name} + " distance must be a non-negative number of miles");
    }
    if (estimate.duration_hours < 0.0 || !std::isfinite(estimate.duration_hours)) {
        throw std::invalid_argument(std::string{leg_name} + " duration must be a non-negative number of hours");
    }
}

std::optional<LegEstimate> resolve_estimate(const std::optional<LegEstimate>& estimate,
                                            const Coordinate& from,
                                            const Coordinate& to,
                                            bool allow_straight_line_fallback,
                                            const char* leg_name) {
    if (estimate.has_value()) {
        validate_estimate(estimate.value(), leg_name);
        return estimate;
    }
    if (!allow_straight_line_fallback) {
        return std::nullopt;
    }
    const LegEstimate fallback = estimate_straight_line_leg(from, to);
    get_logger()->warn("No routed figures for {}; using straight-line estimate of {:.1f} mi", leg_name, fallback.distance_miles);
    return fallback;
}

}  // namespace

double haversine_distance_miles(const Coordinate& from, const Coordinate& to) {
    const auto to_radians = [](double degrees) {
        return degrees * std::numbers::pi / 180.0;
    };

    const double lat1 = to_radians(from.latitude_deg);
    const double lat2 = to_radians(to.latitude_deg);
    const double delta_lat = to_radians(to.latitude_deg - from.latitude_deg);
    const double delta_lon = to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_earth_radius_miles * c;
}

LegEstimate estimate_straight_line_leg(const Coordinate& from, const Coordinate& to) {
    const double distance_miles = haversine_distance_miles(from, to);
    return LegEstimate{distance_miles, distance_miles / k_fallback_speed_mph};
}

RouteLegList build_route_legs(
    const Coordinate& current,
    const Coordinate& pickup,
    const Coordinate& dropoff,
    const std::optional<LegEstimate>& leg_to_pickup,
    const std::optional<LegEstimate>& leg_to_dropoff,
    bool allow_straight_line_fallback
) {
    RouteLegList legs;

    const auto first = resolve_estimate(leg_to_pickup, current, pickup, allow_straight_line_fallback, "leg to pickup");
    if (first.has_value()) {
        legs.push_back(RouteLeg{current, pickup, first->distance_miles, first->duration_hours, LegKind::ToPickup, k_to_pickup_description});
    }

    const auto second = resolve_estimate(leg_to_dropoff, pickup, dropoff, allow_straight_line_fallback, "leg to dropoff");
    if (second.has_value()) {
        legs.push_back(RouteLeg{pickup, dropoff, second->distance_miles, second->duration_hours, LegKind::ToDropoff, k_to_dropoff_description});
    }

    if (legs.empty()) {
        throw InsufficientInputError("Trip requires at least one route leg");
    }
    return legs;
}

std::string_view to_string(LegKind kind) noexcept {
    return kind == LegKind::ToDropoff ? "to_dropoff" : "to_pickup";
}

}  // namespace hos_planner
