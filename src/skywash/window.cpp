#include "skywash/window.hpp"

#include <stdexcept>

#include "skywash/geometry.hpp"

namespace skywash {

Window make_window(WindowId id, const WindowCorners& corners) {
    if (!is_coplanar_in_z(corners)) {
        throw std::invalid_argument("Window corners must share a single z plane");
    }
    const PlanarBounds bounds = planar_bounds(corners);

    Window window{};
    window.id = id;
    window.corners = corners;
    window.center = Position{
        (bounds.min_x + bounds.max_x) / 2.0,
        (bounds.min_y + bounds.max_y) / 2.0,
        corners.front().z
    };
    window.size = WindowSize{bounds.max_x - bounds.min_x, bounds.max_y - bounds.min_y};
    return window;
}

WindowCorners corners_from_observation(const WindowObservation& observation) noexcept {
    const Position& origin = observation.origin;
    return WindowCorners{
        Position{origin.x, origin.y, origin.z},
        Position{origin.x + observation.width_m, origin.y, origin.z},
        Position{origin.x + observation.width_m, origin.y + observation.height_m, origin.z},
        Position{origin.x, origin.y + observation.height_m, origin.z}
    };
}

}  // namespace skywash
