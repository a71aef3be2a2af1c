// === Errors and Warnings =====================================================
//
// Fatal planner failures are exceptions derived from the standard hierarchy.
// Degrade-and-continue conditions are returned to callers as PlanWarning
// values next to the result they affected.

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace hos_planner {

/** @brief Fewer legs or waypoints than a plan requires. */
class InsufficientInputError final : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

/** @brief Supplied duty history contained no parseable record at all. */
class NoValidLogsError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Place lookup exceeded its time budget. */
class ResolverTimeoutError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Kinds of non-fatal conditions surfaced alongside results. */
enum class WarningKind {
    ResolverFailure,         /**< Place lookup threw; placeholder used. */
    ResolverTimeout,         /**< Place lookup timed out; placeholder used. */
    SkippedHistoryRecord,    /**< History record dropped as unparseable. */
    SubstitutedHistoryDate,  /**< History record kept with an inferred date. */
    UnusedSplitOption        /**< 8/2 split requested; 7/3 scheduled instead. */
};

/** @brief A single degrade-and-continue condition. */
struct PlanWarning final {
    WarningKind kind{};
    std::string detail{};
};

using PlanWarningList = std::vector<PlanWarning>;

}  // namespace hos_planner
