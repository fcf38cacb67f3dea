// === Formatting ==============================================================
//
// fmt formatters for mission types so log statements can pass positions and
// states straight to spdlog.

#pragma once

#include <string_view>

#include <fmt/format.h>

#include "skywash/types.hpp"

template <>
struct fmt::formatter<skywash::Position> : fmt::formatter<std::string_view> {
    auto format(const skywash::Position& position, fmt::format_context& context) const -> decltype(context.out()) {
        return fmt::format_to(context.out(), "({:.2f}, {:.2f}, {:.2f})", position.x, position.y, position.z);
    }
};

template <>
struct fmt::formatter<skywash::MissionState> : fmt::formatter<std::string_view> {
    auto format(skywash::MissionState state, fmt::format_context& context) const -> decltype(context.out()) {
        return fmt::formatter<std::string_view>::format(skywash::to_string(state), context);
    }
};
