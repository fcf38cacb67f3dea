// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the mission model (time primitives, cartesian positions, mission states and
// the fixed vehicle profile).

#pragma once

#include <chrono>
#include <string_view>

namespace skywash {

/**
 * @brief Alias for durations measured in seconds with double precision.
 *
 * Every simulated delay (takeoff, scan tick, move, cleaning pass) advances the
 * logical mission clock by one of these instead of sleeping.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Cartesian point in metres.
 */
struct Position final {
    double x{};  /**< Lateral offset along the facade. */
    double y{};  /**< Second axis; also the axis checked against the altitude ceiling. */
    double z{};  /**< Third axis; stand-off direction toward the facade. */

    friend bool operator==(const Position&, const Position&) = default;
};

/**
 * @brief Width/height pair of a detected window in metres.
 */
struct WindowSize final {
    double width_m{};
    double height_m{};
};

/**
 * @brief Enumerates the lifecycle states of a cleaning mission.
 */
enum class MissionState {
    Idle,          /**< On the ground awaiting takeoff. */
    Scanning,      /**< Airborne and sweeping the facade for windows. */
    Mapping,       /**< Scan finished; window data is being consolidated. */
    PathPlanning,  /**< A cleaning path has been generated. */
    Cleaning,      /**< Executing the cleaning path. */
    Returning,     /**< Heading back to the home position. */
    Emergency      /**< Mission aborted; only landing and ground service remain. */
};

/**
 * @brief Upper-case label used in logs and mission events.
 */
[[nodiscard]] constexpr std::string_view to_string(MissionState state) noexcept {
    switch (state) {
        case MissionState::Idle:
            return "IDLE";
        case MissionState::Scanning:
            return "SCANNING";
        case MissionState::Mapping:
            return "MAPPING";
        case MissionState::PathPlanning:
            return "PATH_PLANNING";
        case MissionState::Cleaning:
            return "CLEANING";
        case MissionState::Returning:
            return "RETURNING";
        case MissionState::Emergency:
            return "EMERGENCY";
    }
    return "UNKNOWN";
}

/**
 * @brief Fixed performance and safety constants of the cleaning vehicle.
 *
 * The defaults describe the single airframe the mission model supports. They
 * are grouped here so components receive the subset they need by value rather
 * than reading globals.
 */
struct VehicleProfile final {
    double cruise_speed_mps{1.0};                 /**< Speed used to derive move durations. */
    double cleaning_rate_m2_per_min{0.5};         /**< Informational cleaning throughput. */
    double max_altitude_m{50.0};                  /**< Ceiling compared against a target's y. */
    double camera_fov_horizontal_deg{60.0};       /**< Informational camera field of view. */
    double camera_fov_vertical_deg{40.0};         /**< Informational camera field of view. */
    double coverage_spacing_m{0.3};               /**< Row spacing of the coverage sweep. */
    double clean_proximity_m{1.0};                /**< Pass-by distance that marks a window cleaned. */
    double approach_standoff_m{0.5};              /**< Offset from a window center before contact. */
    double segmentation_threshold_m{10.0};        /**< Moves longer than this are segmented. */
    double segment_length_m{5.0};                 /**< Nominal sub-step length for segmented moves. */
    double takeoff_altitude_m{5.0};               /**< Climb applied on takeoff. */
    double detection_probability{0.1};            /**< Chance per scan tick of a detection event. */
    double scan_battery_cost_percent{0.05};       /**< Battery spent per scan tick. */
    double waypoint_battery_cost_percent{0.1};    /**< Battery spent per executed waypoint. */
    double waypoint_fluid_cost_percent{0.2};      /**< Fluid spent per executed waypoint. */
    double battery_critical_percent{10.0};        /**< Below this the mission escalates to EMERGENCY. */
    double battery_low_percent{15.0};             /**< Below this a scan aborts and returns home. */
    double fluid_low_percent{5.0};                /**< Below this cleaning stops and returns home. */
    Duration takeoff_duration{2.0};               /**< Simulated takeoff time. */
    Duration scan_tick{1.0};                      /**< Granularity of the scan loop. */
    Duration cleaning_activation_duration{0.5};   /**< Spray and wipe time per activation. */
    Duration recharge_duration{2.0};              /**< Ground service time for a recharge. */
    Duration refill_duration{1.5};                /**< Ground service time for a fluid refill. */
};

}  // namespace skywash
