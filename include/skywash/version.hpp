// === Version Metadata ========================================================
//
// Exposes the simulator's semantic version string used in logs.

#pragma once

#include <string_view>

namespace skywash {

inline constexpr std::string_view k_version{"0.1.0"};

}  // namespace skywash
