// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the trip planner
// application. `ConfigurationLoader` translates environment variables into
// these structures so downstream modules never touch `std::getenv` directly.

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "hos_planner/planner_options.hpp"
#include "hos_planner/types.hpp"

namespace hos_planner {

/**
 * @brief Immutable bundle of runtime knobs for the trip planner.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};                          /**< Destination directory for structured logs. */
    std::string log_level{};                              /**< spdlog level name applied at startup. */
    PlannerOptions planner{};                             /**< Weekly mode, cycle hours, and exception flags. */
    /**
     * Budget for each place lookup (HOS_PLANNER_RESOLVER_TIMEOUT_MS). A lookup
     * that overruns it keeps running on a detached thread; those threads are
     * not capped, so a provider that never answers leaves one thread behind per
     * timed-out lookup (at most three per plan).
     */
    std::chrono::milliseconds resolver_timeout{};
    std::optional<std::filesystem::path> history_file{};  /**< Duty history used for rolling hours. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static PlannerOptions load_planner_options();
};

}  // namespace hos_planner
