#include "skywash/path_planner.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "skywash/geometry.hpp"
#include "skywash/logging.hpp"

namespace skywash {

PathPlanner::PathPlanner(PlannerConfig config)
    : config_(config) {
    if (config_.coverage_spacing_m <= 0.0) {
        throw std::invalid_argument("PathPlanner coverage spacing must be positive");
    }
}

CleaningPath PathPlanner::plan(const std::vector<Window>& windows) const {
    std::vector<const Window*> list_ordered;
    list_ordered.reserve(windows.size());
    for (const Window& window : windows) {
        list_ordered.push_back(&window);
    }
    std::stable_sort(list_ordered.begin(), list_ordered.end(), [](const Window* lhs, const Window* rhs) {
        return lhs->center.y < rhs->center.y;
    });

    CleaningPath path;
    for (const Window* window : list_ordered) {
        path.push_back(approach_point(*window));
        const std::vector<Position> list_sweep = coverage_pattern(window->corners);
        path.insert(path.end(), list_sweep.begin(), list_sweep.end());
    }
    if (!path.empty()) {
        path.push_back(path.front());
    }

    auto logger = get_logger();
    logger->info("Generated path with {} waypoints over {} windows", path.size(), windows.size());
    return path;
}

std::vector<Position> PathPlanner::coverage_pattern(const WindowCorners& corners) const {
    const PlanarBounds bounds = planar_bounds(corners);
    const double plane_z = corners.front().z;

    std::vector<Position> list_points;
    // Rows accumulate additively, so the last row may fall just short of max_y.
    for (double row_y = bounds.min_y; row_y <= bounds.max_y; row_y += config_.coverage_spacing_m) {
        list_points.push_back(Position{bounds.min_x, row_y, plane_z});
        list_points.push_back(Position{bounds.max_x, row_y, plane_z});
    }
    return list_points;
}

Position PathPlanner::approach_point(const Window& window) const noexcept {
    return Position{window.center.x, window.center.y, window.center.z - config_.approach_standoff_m};
}

}  // namespace skywash
