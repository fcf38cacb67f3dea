// === Path Planner ============================================================
//
// Turns the registered windows into an ordered cleaning path: an approach
// point in front of each window followed by a boustrophedon coverage sweep of
// its surface, closed back onto the first waypoint.

#pragma once

#include <vector>

#include "skywash/window.hpp"

namespace skywash {

using CleaningPath = std::vector<Position>;

/** @brief Spacing and stand-off parameters for path generation. */
struct PlannerConfig final {
    double coverage_spacing_m{0.3};
    double approach_standoff_m{0.5};
};

/** @brief Stateless generator of cleaning paths. */
class PathPlanner final {
  public:
    /**
     * @throws std::invalid_argument when the spacing is not positive.
     */
    explicit PathPlanner(PlannerConfig config);

    /**
     * @brief Build the closed cleaning path for @p windows.
     *
     * Windows are visited in ascending order of their center's y. The result
     * is empty only when @p windows is empty; otherwise the last waypoint
     * repeats the first.
     */
    [[nodiscard]] CleaningPath plan(const std::vector<Window>& windows) const;

    /**
     * @brief Row-by-row sweep over the x/y bounding box of @p corners.
     *
     * Each row yields the left edge point followed by the right edge point;
     * rows start at the minimum y and advance by the configured spacing while
     * they remain at or below the maximum y.
     */
    [[nodiscard]] std::vector<Position> coverage_pattern(const WindowCorners& corners) const;

    /** @brief Stand-off point in front of @p window along -z. */
    [[nodiscard]] Position approach_point(const Window& window) const noexcept;

  private:
    PlannerConfig config_;
};

}  // namespace skywash
