#include <stdexcept>

#include <catch2/catch.hpp>

#include "skywash/resource_manager.hpp"

using namespace skywash;

TEST_CASE("ResourceManager starts with full battery and fluid") {
    const ResourceManager resources{};
    REQUIRE(resources.battery() == Approx(100.0));
    REQUIRE(resources.fluid() == Approx(100.0));
    REQUIRE_FALSE(resources.is_battery_low());
    REQUIRE_FALSE(resources.is_battery_critical());
    REQUIRE_FALSE(resources.is_fluid_low());
}

TEST_CASE("Battery thresholds are strict") {
    ResourceManager resources{};

    resources.deplete_battery(85.0);
    REQUIRE_FALSE(resources.is_battery_low());

    resources.deplete_battery(0.5);
    REQUIRE(resources.is_battery_low());
    REQUIRE_FALSE(resources.is_battery_critical());

    resources.deplete_battery(5.0);
    REQUIRE(resources.is_battery_critical());
}

TEST_CASE("Fluid threshold is strict") {
    ResourceManager resources{};

    resources.deplete_fluid(95.0);
    REQUIRE_FALSE(resources.is_fluid_low());

    resources.deplete_fluid(1.0);
    REQUIRE(resources.is_fluid_low());
}

TEST_CASE("Levels clamp at zero") {
    ResourceManager resources{};
    resources.deplete_battery(250.0);
    resources.deplete_fluid(101.0);

    REQUIRE(resources.battery() == Approx(0.0));
    REQUIRE(resources.fluid() == Approx(0.0));
}

TEST_CASE("Recharge and refill restore full levels") {
    ResourceManager resources{};
    resources.deplete_battery(42.0);
    resources.deplete_fluid(17.0);

    resources.recharge();
    REQUIRE(resources.battery() == Approx(100.0));
    REQUIRE(resources.fluid() == Approx(83.0));

    resources.refill();
    REQUIRE(resources.fluid() == Approx(100.0));
}

TEST_CASE("Negative depletion is rejected") {
    ResourceManager resources{};
    REQUIRE_THROWS_AS(resources.deplete_battery(-1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(resources.deplete_fluid(-0.1), std::invalid_argument);
    REQUIRE(resources.battery() == Approx(100.0));
}

TEST_CASE("Custom thresholds drive the predicates") {
    ResourceManager resources{ResourceThresholds{30.0, 50.0, 20.0}};
    resources.deplete_battery(60.0);
    resources.deplete_fluid(85.0);

    REQUIRE(resources.is_battery_low());
    REQUIRE_FALSE(resources.is_battery_critical());
    REQUIRE(resources.is_fluid_low());
}
