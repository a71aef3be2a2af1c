// === Version Metadata ========================================================
//
// Exposes the planner's semantic version string used in logs.

#pragma once

#include <string_view>

namespace hos_planner {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace hos_planner
