#pragma once

#include <cstddef>

#include "skywash/types.hpp"

namespace skywash {

/**
 * @brief Captures the observable state of a mission at a point in time.
 */
struct MissionSnapshot final {
    MissionState state{MissionState::Idle}; /**< Current lifecycle state. */
    Position position{};                    /**< Current vehicle position. */
    double battery_percent{};               /**< Remaining battery percentage. */
    double fluid_percent{};                 /**< Remaining cleaning fluid percentage. */
    std::size_t window_count{};             /**< Windows currently registered. */
    std::size_t cleaned_window_count{};     /**< Registered windows marked cleaned. */
    std::size_t waypoint_count{};           /**< Length of the current cleaning path. */
    Duration mission_clock{};               /**< Logical time elapsed since the controller was created. */
};

}  // namespace skywash
