#pragma once

#include <span>

#include "skywash/types.hpp"

namespace skywash {

/** @brief Axis-aligned extent of a point set on the x/y axes. */
struct PlanarBounds final {
    double min_x{};
    double max_x{};
    double min_y{};
    double max_y{};
};

/** @brief Euclidean distance between two positions. */
[[nodiscard]] double distance_m(const Position& from, const Position& to) noexcept;

/** @brief Point at fraction @p t along the segment from @p from to @p to. */
[[nodiscard]] Position interpolate(const Position& from, const Position& to, double t) noexcept;

/**
 * @brief Bounding box of @p points on the x/y axes.
 *
 * @throws std::invalid_argument when @p points is empty.
 */
[[nodiscard]] PlanarBounds planar_bounds(std::span<const Position> points);

/** @brief True when every point shares the z of the first one. */
[[nodiscard]] bool is_coplanar_in_z(std::span<const Position> points) noexcept;

}  // namespace skywash
