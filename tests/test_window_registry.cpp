#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "skywash/window_registry.hpp"

using namespace skywash;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    skywash::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("WindowRegistry assigns identifiers in detection order") {
    WindowRegistry registry{};
    const auto first = registry.register_observation(WindowObservation{Position{0.0, 0.0, 0.0}, 1.0, 1.0});
    const auto second = registry.register_observation(WindowObservation{Position{5.0, 0.0, 0.0}, 1.0, 1.0});

    REQUIRE(first == WindowId{1});
    REQUIRE(second == WindowId{2});
    REQUIRE(registry.size() == 2);
    REQUIRE(registry.find(2).has_value());
    REQUIRE_FALSE(registry.find(3).has_value());
}

TEST_CASE("WindowRegistry rejects degenerate observations") {
    WindowRegistry registry{};
    REQUIRE_FALSE(registry.register_observation(WindowObservation{Position{0.0, 0.0, 0.0}, 0.0, 1.0}).has_value());
    REQUIRE_FALSE(registry.register_observation(WindowObservation{Position{0.0, 0.0, 0.0}, 1.0, -2.0}).has_value());
    REQUIRE(registry.empty());
}

TEST_CASE("Deduplication keeps the first window seen at a rounded position") {
    WindowRegistry registry{};
    // Both centers sit at (1.0, 0.5, 0.0) but the rectangles differ.
    registry.register_observation(WindowObservation{Position{0.0, 0.0, 0.0}, 2.0, 1.0});
    registry.register_observation(WindowObservation{Position{0.5, 0.25, 0.0}, 1.0, 0.5});
    registry.register_observation(WindowObservation{Position{10.0, 0.0, 0.0}, 1.0, 1.0});

    REQUIRE(registry.deduplicate() == 1);
    REQUIRE(registry.size() == 2);

    const Window& kept = registry.windows().front();
    REQUIRE(kept.id == 1);
    REQUIRE(kept.size.width_m == Approx(2.0));
    REQUIRE(kept.size.height_m == Approx(1.0));
    REQUIRE(registry.windows().back().id == 3);
}

TEST_CASE("Deduplication merges centers that round to the same 0.1 m cell") {
    WindowRegistry registry{};
    registry.register_observation(WindowObservation{Position{0.0, 0.0, 2.0}, 2.02, 1.0});
    registry.register_observation(WindowObservation{Position{0.0, 0.0, 2.0}, 2.06, 1.0});
    registry.register_observation(WindowObservation{Position{0.0, 0.0, 2.0}, 2.4, 1.0});

    REQUIRE(registry.deduplicate() == 1);
    REQUIRE(registry.size() == 2);
}

TEST_CASE("Deduplication rounds exact ties to even") {
    WindowRegistry registry{};
    registry.register_observation(WindowObservation{Position{0.0, 0.0, 0.0}, 0.5, 1.0});   // center x 0.25
    registry.register_observation(WindowObservation{Position{0.05, 0.0, 0.0}, 0.5, 1.0});  // center x 0.30

    REQUIRE(registry.deduplicate() == 0);
    REQUIRE(registry.size() == 2);
}

TEST_CASE("Deduplication rounds the stored value, not its decimal spelling") {
    WindowRegistry registry{};
    // 0.15 is stored just below 0.15 and rounds down to 0.1.
    registry.register_observation(WindowObservation{Position{0.0, 0.0, 0.0}, 0.3, 1.0});  // center x 0.15
    registry.register_observation(WindowObservation{Position{0.0, 0.0, 0.0}, 0.4, 1.0});  // center x 0.20

    REQUIRE(registry.deduplicate() == 0);
    REQUIRE(registry.size() == 2);
}

TEST_CASE("Deduplication treats centers rounding to negative zero as zero") {
    WindowRegistry registry{};
    registry.register_observation(WindowObservation{Position{-0.08, 0.0, 0.0}, 0.08, 1.0});  // center x -0.04
    registry.register_observation(WindowObservation{Position{0.0, 0.0, 0.0}, 0.08, 1.0});    // center x 0.04

    REQUIRE(registry.deduplicate() == 1);
    REQUIRE(registry.windows().front().id == 1);
}

TEST_CASE("Deduplication is idempotent") {
    WindowRegistry registry{};
    registry.register_observation(WindowObservation{Position{0.0, 0.0, 0.0}, 1.0, 1.0});
    registry.register_observation(WindowObservation{Position{0.0, 0.0, 0.0}, 1.0, 1.0});

    REQUIRE(registry.deduplicate() == 1);
    REQUIRE(registry.deduplicate() == 0);
    REQUIRE(registry.size() == 1);
}

TEST_CASE("mark_cleaned_near flags every window within the radius") {
    WindowRegistry registry{};
    registry.register_observation(WindowObservation{Position{0.0, 0.0, 0.0}, 1.0, 1.0});  // center (0.5, 0.5, 0)
    registry.register_observation(WindowObservation{Position{0.6, 0.0, 0.0}, 1.0, 1.0});  // center (1.1, 0.5, 0)
    registry.register_observation(WindowObservation{Position{5.0, 0.0, 0.0}, 1.0, 1.0});  // center (5.5, 0.5, 0)

    REQUIRE(registry.mark_cleaned_near(Position{0.8, 0.5, 0.0}, 1.0) == 2);
    REQUIRE(registry.cleaned_count() == 2);

    // Marking again is harmless.
    REQUIRE(registry.mark_cleaned_near(Position{0.8, 0.5, 0.0}, 1.0) == 2);
    REQUIRE(registry.cleaned_count() == 2);
    REQUIRE_FALSE(registry.windows().back().cleaned);
}

TEST_CASE("mark_cleaned_near uses a strict radius") {
    WindowRegistry registry{};
    registry.register_observation(WindowObservation{Position{0.0, 0.0, 0.0}, 2.0, 2.0});  // center (1, 1, 0)

    REQUIRE(registry.mark_cleaned_near(Position{1.0, 1.0, 1.0}, 1.0) == 0);
    REQUIRE(registry.mark_cleaned_near(Position{1.0, 1.0, 0.99}, 1.0) == 1);
}
