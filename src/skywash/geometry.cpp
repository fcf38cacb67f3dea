#include "skywash/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace skywash {

double distance_m(const Position& from, const Position& to) noexcept {
    const double delta_x = to.x - from.x;
    const double delta_y = to.y - from.y;
    const double delta_z = to.z - from.z;
    return std::sqrt(delta_x * delta_x + delta_y * delta_y + delta_z * delta_z);
}

Position interpolate(const Position& from, const Position& to, double t) noexcept {
    return Position{
        from.x + (to.x - from.x) * t,
        from.y + (to.y - from.y) * t,
        from.z + (to.z - from.z) * t
    };
}

PlanarBounds planar_bounds(std::span<const Position> points) {
    if (points.empty()) {
        throw std::invalid_argument("planar_bounds requires at least one point");
    }
    const auto [min_x, max_x] = std::minmax_element(points.begin(), points.end(), [](const Position& lhs, const Position& rhs) {
        return lhs.x < rhs.x;
    });
    const auto [min_y, max_y] = std::minmax_element(points.begin(), points.end(), [](const Position& lhs, const Position& rhs) {
        return lhs.y < rhs.y;
    });
    return PlanarBounds{min_x->x, max_x->x, min_y->y, max_y->y};
}

bool is_coplanar_in_z(std::span<const Position> points) noexcept {
    if (points.empty()) {
        return true;
    }
    const double reference_z = points.front().z;
    return std::all_of(points.begin(), points.end(), [reference_z](const Position& point) {
        return point.z == reference_z;
    });
}

}  // namespace skywash
