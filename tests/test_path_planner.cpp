#include <cmath>
#include <stdexcept>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "skywash/path_planner.hpp"

using namespace skywash;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    skywash::test::ensure_logger_initialized();
    return true;
}();

Window window_at(WindowId id, Position origin, double width_m, double height_m) {
    return make_window(id, corners_from_observation(WindowObservation{origin, width_m, height_m}));
}
}  // namespace

TEST_CASE("Coverage pattern sweeps each row from the left edge to the right edge") {
    const PathPlanner planner{PlannerConfig{0.3, 0.5}};
    const Window window = window_at(1, Position{1.0, 2.0, 3.0}, 2.0, 1.0);

    const std::vector<Position> points = planner.coverage_pattern(window.corners);
    const auto expected_rows = static_cast<std::size_t>(std::floor(1.0 / 0.3)) + 1;

    REQUIRE(points.size() == expected_rows * 2);
    for (std::size_t row = 0; row < expected_rows; ++row) {
        const Position& left = points[row * 2];
        const Position& right = points[row * 2 + 1];
        REQUIRE(left.x == Approx(1.0));
        REQUIRE(right.x == Approx(3.0));
        REQUIRE(left.y == Approx(2.0 + 0.3 * static_cast<double>(row)));
        REQUIRE(right.y == Approx(left.y));
        REQUIRE(left.z == Approx(3.0));
        REQUIRE(right.z == Approx(3.0));
    }
}

TEST_CASE("Coverage pattern row count follows the window height") {
    const PathPlanner planner{PlannerConfig{0.3, 0.5}};

    REQUIRE(planner.coverage_pattern(window_at(1, Position{0.0, 0.0, 0.0}, 1.0, 0.5).corners).size() == 4);
    REQUIRE(planner.coverage_pattern(window_at(2, Position{0.0, 0.0, 0.0}, 1.0, 1.7).corners).size() == 12);
    REQUIRE(planner.coverage_pattern(window_at(3, Position{0.0, 0.0, 0.0}, 1.0, 0.1).corners).size() == 2);
}

TEST_CASE("Single window plan has approach, four rows and a closing point") {
    const PathPlanner planner{PlannerConfig{0.3, 0.5}};
    const std::vector<Window> windows{window_at(1, Position{4.0, 4.5, 5.0}, 2.0, 1.0)};

    const CleaningPath path = planner.plan(windows);

    REQUIRE(path.size() == 10);
    REQUIRE(path.front().x == Approx(5.0));
    REQUIRE(path.front().y == Approx(5.0));
    REQUIRE(path.front().z == Approx(4.5));
    REQUIRE(path.back() == path.front());
    REQUIRE(path[1] == Position{4.0, 4.5, 5.0});
    REQUIRE(path[2] == Position{6.0, 4.5, 5.0});
}

TEST_CASE("Windows are visited in ascending order of their center's y") {
    const PathPlanner planner{PlannerConfig{0.3, 0.5}};
    const std::vector<Window> windows{
        window_at(1, Position{0.0, 8.0, 2.0}, 1.0, 0.5),
        window_at(2, Position{3.0, 1.0, 2.0}, 1.0, 0.5)
    };

    const CleaningPath path = planner.plan(windows);

    // Each window contributes 1 approach + 2 rows * 2 points.
    REQUIRE(path.size() == 11);
    REQUIRE(path[0].x == Approx(3.5));
    REQUIRE(path[0].y == Approx(1.25));
    REQUIRE(path[5].x == Approx(0.5));
    REQUIRE(path[5].y == Approx(8.25));
    REQUIRE(path.back() == path.front());
}

TEST_CASE("Planning nothing yields an empty path") {
    const PathPlanner planner{PlannerConfig{0.3, 0.5}};
    REQUIRE(planner.plan({}).empty());
}

TEST_CASE("PathPlanner rejects a non-positive spacing") {
    REQUIRE_THROWS_AS(PathPlanner(PlannerConfig{0.0, 0.5}), std::invalid_argument);
}
