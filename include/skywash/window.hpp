// === Window ==================================================================
//
// Geometry of a single detected window plus the raw observation format the
// detection source reports.

#pragma once

#include <array>
#include <cstdint>

#include "skywash/types.hpp"

namespace skywash {

using WindowId = std::uint32_t;
using WindowCorners = std::array<Position, 4>;

/**
 * @brief Axis-aligned rectangle reported by a detection source.
 *
 * @p origin is the corner with the smallest x and y; the rectangle extends
 * along +x by @p width_m and +y by @p height_m in the plane z = origin.z.
 */
struct WindowObservation final {
    Position origin{};
    double width_m{};
    double height_m{};
};

/**
 * @brief A window registered during a scan.
 *
 * All four corners share one z. @p center is the midpoint of the corners'
 * bounding box at that z and @p size is the bounding box extent.
 */
struct Window final {
    WindowId id{};
    WindowCorners corners{};
    Position center{};
    WindowSize size{};
    bool cleaned{false};
};

/**
 * @brief Build a window from four coplanar corners.
 *
 * @throws std::invalid_argument when the corners do not share one z.
 */
[[nodiscard]] Window make_window(WindowId id, const WindowCorners& corners);

/** @brief Corner ring (counter-clockwise from the origin) of an observation. */
[[nodiscard]] WindowCorners corners_from_observation(const WindowObservation& observation) noexcept;

}  // namespace skywash
