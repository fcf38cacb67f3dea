// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the simulator.
// `ConfigurationLoader` translates environment variables into this structure
// so downstream modules never touch `std::getenv` directly. Vehicle constants
// are fixed and always take their `VehicleProfile` defaults.

#pragma once

#include <cstdint>
#include <string>

#include "skywash/types.hpp"

namespace skywash {

/**
 * @brief Immutable bundle of runtime knobs for one simulated mission.
 */
struct Configuration final {
    std::string log_directory{};   /**< Destination directory for structured logs. */
    std::string log_level{};       /**< spdlog level name applied after startup. */
    Duration scan_duration{};      /**< Length of the facade scan. */
    std::uint64_t random_seed{};   /**< Seed shared by detection and tick sampling. */
    Position home_position{};      /**< Launch and recovery point. */
    VehicleProfile profile{};      /**< Fixed vehicle constants. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Read the environment, initialize logging and return the configuration. */
    static Configuration load();

  private:
    static Duration load_scan_duration();
    static std::uint64_t load_random_seed();
};

}  // namespace skywash
