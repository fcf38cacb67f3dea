// === Mission Controller ======================================================
//
// Top-level state machine of a window-cleaning mission. Sequences takeoff,
// facade scan, window consolidation, path planning, cleaning execution and
// return-to-home while reacting to battery, fluid and motion failures.
//
// The controller is the single owner of the mission aggregate (state,
// position, resources, window registry, cleaning path and logical clock).
// Observers read it through `context()` / `snapshot()` or by draining the
// MissionEventBus; nothing else mutates it.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "skywash/detection_source.hpp"
#include "skywash/effector.hpp"
#include "skywash/logging.hpp"
#include "skywash/mission_event_bus.hpp"
#include "skywash/motion_executor.hpp"
#include "skywash/path_planner.hpp"
#include "skywash/resource_manager.hpp"
#include "skywash/types.hpp"
#include "skywash/window_registry.hpp"

namespace skywash {

/**
 * @brief Mutable aggregate describing one vehicle's mission.
 */
struct MissionContext final {
    MissionState state{MissionState::Idle};
    Position position{};
    Position home_position{};
    ResourceManager resources{};
    WindowRegistry registry{};
    CleaningPath cleaning_path{};
    Duration mission_clock{0.0};
};

/**
 * @brief External collaborators the controller drives.
 *
 * All references must outlive the controller.
 */
struct MissionCollaborators final {
    Effector& effector;
    DetectionSource& detection_source;
    RandomSource& random_source;
    MissionEventBus& event_bus;
};

/** @brief Orchestrates the scan → plan → clean → return lifecycle. */
class MissionController final {
  public:
    /**
     * @brief Construct a controller parked at @p home_position.
     *
     * @param profile Fixed vehicle constants.
     * @param home_position Launch and recovery point.
     * @param collaborators Effector, detection, randomness and event sink.
     * @param initial_resources Starting consumables; full tanks when omitted.
     */
    MissionController(
        VehicleProfile profile,
        Position home_position,
        MissionCollaborators collaborators,
        std::optional<ResourceManager> initial_resources = std::nullopt
    );

    [[nodiscard]] const MissionContext& context() const noexcept;
    [[nodiscard]] MissionState state() const noexcept;
    [[nodiscard]] MissionSnapshot snapshot() const;
    [[nodiscard]] std::size_t cleaned_window_count() const noexcept;

    /** @brief IDLE → SCANNING and climb to the takeoff altitude above home. */
    bool takeoff();

    /**
     * @brief Sweep the facade for @p scan_time, one tick per second.
     *
     * Ends in MAPPING with the registry deduplicated, including when low
     * battery cuts the scan short and sends the vehicle home first.
     */
    bool scan(Duration scan_time);

    /** @brief Collapse duplicate window observations; no state change. */
    std::size_t process_window_data();

    /** @brief Replace the cleaning path with one covering every registered window. */
    bool plan_cleaning_path();

    /**
     * @brief Fly the cleaning path, then return home.
     *
     * @return false when critical battery or a motion failure escalated the
     *         mission to EMERGENCY; true otherwise, including an early stop
     *         for low fluid.
     */
    bool execute_cleaning();

    /** @brief Fly home and land; refused while in EMERGENCY. */
    bool return_to_home();

    /** @brief Descend to ground level at the current x/y. */
    bool land();

    /** @brief Ground-service battery swap; allowed in any state. */
    void recharge();

    /** @brief Ground-service fluid refill; allowed in any state. */
    void refill_fluid();

    /** @brief Crew acknowledgement that returns a landed EMERGENCY vehicle to IDLE. */
    bool clear_emergency();

  private:
    void transition_to(MissionState next_state, const std::string& reason);
    void publish(MissionEventKind kind, std::string description);
    bool reject(const std::string& operation, const std::string& reason);
    void trigger_low_battery();
    void trigger_emergency(const std::string& reason);
    void advance_clock(Duration elapsed);
    void activate_cleaning();
    [[nodiscard]] bool is_on_ground() const noexcept;

    VehicleProfile profile_;
    MissionCollaborators collaborators_;
    PathPlanner planner_;
    MotionExecutor motion_executor_;
    MissionContext struct_context_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace skywash
