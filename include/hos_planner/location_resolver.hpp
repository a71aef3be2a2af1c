// === Location Resolver =======================================================
//
// Injected capability that turns a coordinate into a formatted place string
// ("street, city, region"). The planner never talks to a geocoding service
// directly; callers hand in a LocationResolver, optionally wrapped in
// TimeoutLocationResolver so a slow provider cannot stall a plan.

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "hos_planner/errors.hpp"
#include "hos_planner/types.hpp"

namespace hos_planner {

/** @brief Placeholder used whenever a city or region cannot be determined. */
inline constexpr std::string_view k_unknown_place{"Unknown"};

/** @brief City/region pair parsed from a resolver's formatted output. */
struct ResolvedPlace final {
    std::string formatted{};
    std::string city{k_unknown_place};
    std::string region{k_unknown_place};
};

/** @brief Maps a coordinate to a formatted, comma-separated place string. */
class LocationResolver {
  public:
    virtual ~LocationResolver() = default;

    /** @brief Resolve @p coordinate; implementations may throw on failure. */
    [[nodiscard]] virtual std::string resolve(const Coordinate& coordinate) = 0;
};

using LocationResolverPtr = std::shared_ptr<LocationResolver>;

/** @brief Default resolver that knows no places. */
class NullLocationResolver final : public LocationResolver {
  public:
    [[nodiscard]] std::string resolve(const Coordinate& coordinate) override;
};

/**
 * @brief Decorator bounding the wall time spent in another resolver.
 *
 * The wrapped call runs on a detached worker that shares ownership of the
 * inner resolver, so an abandoned lookup finishes harmlessly in the background.
 * Throws ResolverTimeoutError when the budget elapses first.
 */
class TimeoutLocationResolver final : public LocationResolver {
  public:
    TimeoutLocationResolver(LocationResolverPtr inner, std::chrono::milliseconds timeout);

    [[nodiscard]] std::string resolve(const Coordinate& coordinate) override;
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept;

  private:
    LocationResolverPtr inner_;
    std::chrono::milliseconds timeout_;
};

/** @brief Result of a non-throwing place lookup. */
struct PlaceLookup final {
    ResolvedPlace place{};
    std::optional<PlanWarning> warning{};
};

/**
 * @brief Split @p formatted on commas and take the last two tokens as city and
 *        region; anything shorter degrades to "Unknown" fields.
 */
[[nodiscard]] ResolvedPlace parse_place(std::string_view formatted);

/** @brief Resolve @p coordinate, converting any failure into a warning. */
[[nodiscard]] PlaceLookup lookup_place(LocationResolver& resolver, const Coordinate& coordinate);

}  // namespace hos_planner
