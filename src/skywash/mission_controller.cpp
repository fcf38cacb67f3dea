#include "skywash/mission_controller.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "skywash/formatting.hpp"
#include "skywash/logging.hpp"

namespace skywash {

namespace {

/**
 * @brief Cleaning runs after every waypoint whose index modulo this value is
 *        above one, i.e. the first two waypoints of each block of ten are
 *        positioning moves only.
 */
constexpr std::size_t k_cleaning_cycle_length{10};
constexpr std::size_t k_cleaning_cycle_skip{1};

ResourceThresholds thresholds_from(const VehicleProfile& profile) {
    return ResourceThresholds{
        profile.battery_critical_percent,
        profile.battery_low_percent,
        profile.fluid_low_percent
    };
}

}  // namespace

MissionController::MissionController(
    VehicleProfile profile,
    Position home_position,
    MissionCollaborators collaborators,
    std::optional<ResourceManager> initial_resources
)
    : profile_(profile),
      collaborators_(collaborators),
      planner_(PlannerConfig{profile.coverage_spacing_m, profile.approach_standoff_m}),
      motion_executor_(
          MotionConfig{
              profile.cruise_speed_mps,
              profile.max_altitude_m,
              profile.segmentation_threshold_m,
              profile.segment_length_m
          },
          collaborators.effector
      ),
      logger_(get_logger()) {
    struct_context_.position = home_position;
    struct_context_.home_position = home_position;
    struct_context_.resources = initial_resources.value_or(ResourceManager{thresholds_from(profile_)});
    logger_->info("Mission controller ready at home {} (battery {:.1f}%, fluid {:.1f}%)",
                  home_position,
                  struct_context_.resources.battery(),
                  struct_context_.resources.fluid());
}

const MissionContext& MissionController::context() const noexcept {
    return struct_context_;
}

MissionState MissionController::state() const noexcept {
    return struct_context_.state;
}

MissionSnapshot MissionController::snapshot() const {
    MissionSnapshot snapshot{};
    snapshot.state = struct_context_.state;
    snapshot.position = struct_context_.position;
    snapshot.battery_percent = struct_context_.resources.battery();
    snapshot.fluid_percent = struct_context_.resources.fluid();
    snapshot.window_count = struct_context_.registry.size();
    snapshot.cleaned_window_count = struct_context_.registry.cleaned_count();
    snapshot.waypoint_count = struct_context_.cleaning_path.size();
    snapshot.mission_clock = struct_context_.mission_clock;
    return snapshot;
}

std::size_t MissionController::cleaned_window_count() const noexcept {
    return struct_context_.registry.cleaned_count();
}

/**
 * @brief Leave the ground and start scanning from the takeoff altitude.
 */
bool MissionController::takeoff() {
    if (struct_context_.state != MissionState::Idle) {
        return reject("takeoff", "drone not idle");
    }
    logger_->info("Taking off...");
    transition_to(MissionState::Scanning, "takeoff");
    const Position& home = struct_context_.home_position;
    struct_context_.position = Position{home.x, home.y, home.z + profile_.takeoff_altitude_m};
    advance_clock(profile_.takeoff_duration);
    return true;
}

/**
 * @brief Tick through the scan budget, sampling detections and draining battery.
 */
bool MissionController::scan(Duration scan_time) {
    if (struct_context_.state != MissionState::Scanning) {
        return reject("scan", "drone not in scanning mode");
    }

    const double tick_budget = std::max(0.0, std::ceil(scan_time / profile_.scan_tick));
    const auto ticks = static_cast<long>(tick_budget);
    logger_->info("Scanning building for {:.0f} seconds...", scan_time.count());

    for (long tick = 0; tick < ticks; ++tick) {
        if (collaborators_.random_source.next_uniform() < profile_.detection_probability) {
            const std::optional<WindowObservation> observation = collaborators_.detection_source.detect(struct_context_.position);
            if (observation.has_value()) {
                const std::optional<WindowId> id = struct_context_.registry.register_observation(*observation);
                if (id.has_value()) {
                    publish(MissionEventKind::WindowDetected, fmt::format("window {} detected on tick {}", *id, tick));
                }
            }
        }
        struct_context_.resources.deplete_battery(profile_.scan_battery_cost_percent);
        advance_clock(profile_.scan_tick);

        if (struct_context_.resources.is_battery_low()) {
            trigger_low_battery();
            break;
        }
    }

    transition_to(MissionState::Mapping, "scan complete");
    logger_->info("Scanning complete. Processing window data...");
    process_window_data();
    return true;
}

std::size_t MissionController::process_window_data() {
    return struct_context_.registry.deduplicate();
}

bool MissionController::plan_cleaning_path() {
    if (struct_context_.state == MissionState::Emergency) {
        return reject("plan cleaning path", "mission is in EMERGENCY");
    }
    if (struct_context_.registry.empty()) {
        return reject("plan cleaning path", "no windows detected, scan first");
    }
    logger_->info("Generating cleaning path...");
    struct_context_.cleaning_path = planner_.plan(struct_context_.registry.windows());
    transition_to(MissionState::PathPlanning, "path generated");
    return true;
}

/**
 * @brief Fly every waypoint, cleaning as we go, and escalate on resource or motion trouble.
 */
bool MissionController::execute_cleaning() {
    if (struct_context_.state == MissionState::Emergency) {
        return reject("execute cleaning", "mission is in EMERGENCY");
    }
    if (struct_context_.cleaning_path.empty()) {
        return reject("execute cleaning", "no cleaning path, plan path first");
    }

    transition_to(MissionState::Cleaning, "starting cleaning sequence");
    const CleaningPath& path = struct_context_.cleaning_path;
    for (std::size_t index = 0; index < path.size(); ++index) {
        ResourceManager& resources = struct_context_.resources;
        if (resources.is_battery_critical()) {
            trigger_emergency(fmt::format("critical battery level {:.1f}%", resources.battery()));
            return false;
        }
        if (resources.is_fluid_low()) {
            logger_->warn("Out of cleaning fluid ({:.1f}%); aborting cleaning", resources.fluid());
            publish(MissionEventKind::ResourceWarning, fmt::format("fluid low at {:.1f}%", resources.fluid()));
            transition_to(MissionState::Returning, "cleaning fluid exhausted");
            break;
        }

        const Position& waypoint = path[index];
        const MoveOutcome outcome = motion_executor_.move_to(struct_context_.position, waypoint);
        struct_context_.position = outcome.position;
        advance_clock(outcome.elapsed);
        if (!outcome.succeeded) {
            trigger_emergency(fmt::format("movement to waypoint {} at {} failed", index, waypoint));
            return false;
        }

        if (index % k_cleaning_cycle_length > k_cleaning_cycle_skip) {
            activate_cleaning();
        }
        resources.deplete_battery(profile_.waypoint_battery_cost_percent);
        resources.deplete_fluid(profile_.waypoint_fluid_cost_percent);

        const std::size_t cleaned = struct_context_.registry.mark_cleaned_near(waypoint, profile_.clean_proximity_m);
        publish(MissionEventKind::WaypointReached,
                fmt::format("waypoint {}/{} reached at {} ({} windows in range)", index + 1, path.size(), waypoint, cleaned));
    }

    logger_->info("Cleaning sequence complete: {}/{} windows cleaned",
                  struct_context_.registry.cleaned_count(),
                  struct_context_.registry.size());
    transition_to(MissionState::Returning, "cleaning sequence complete");
    return_to_home();
    return true;
}

bool MissionController::return_to_home() {
    if (struct_context_.state == MissionState::Emergency) {
        return reject("return to home", "mission is in EMERGENCY, landing in place only");
    }
    logger_->info("Returning to home position...");
    transition_to(MissionState::Returning, "return to home");

    const MoveOutcome outcome = motion_executor_.move_to(struct_context_.position, struct_context_.home_position);
    struct_context_.position = outcome.position;
    advance_clock(outcome.elapsed);
    if (!outcome.succeeded) {
        logger_->error("Return to home stopped at {}; landing there", struct_context_.position);
    }
    land();
    return outcome.succeeded;
}

/**
 * @brief Descend vertically to ground level; an EMERGENCY stays latched after touchdown.
 */
bool MissionController::land() {
    logger_->info("Landing at {}...", struct_context_.position);
    const Position touchdown{
        struct_context_.position.x,
        struct_context_.position.y,
        struct_context_.home_position.z
    };
    const MoveOutcome outcome = motion_executor_.move_to(struct_context_.position, touchdown);
    struct_context_.position = outcome.position;
    advance_clock(outcome.elapsed);
    if (!outcome.succeeded) {
        logger_->error("Descent interrupted at {}", struct_context_.position);
    }

    if (struct_context_.state != MissionState::Emergency) {
        transition_to(MissionState::Idle, "landed");
    }
    return outcome.succeeded;
}

void MissionController::recharge() {
    logger_->info("Recharging battery...");
    struct_context_.resources.recharge();
    advance_clock(profile_.recharge_duration);
    logger_->info("Battery fully charged");
}

void MissionController::refill_fluid() {
    logger_->info("Refilling cleaning fluid...");
    struct_context_.resources.refill();
    advance_clock(profile_.refill_duration);
    logger_->info("Cleaning fluid refilled");
}

bool MissionController::clear_emergency() {
    if (struct_context_.state != MissionState::Emergency) {
        return reject("clear emergency", "no emergency is active");
    }
    if (!is_on_ground()) {
        return reject("clear emergency", "vehicle is still airborne");
    }
    transition_to(MissionState::Idle, "emergency cleared by ground crew");
    return true;
}

void MissionController::transition_to(MissionState next_state, const std::string& reason) {
    const MissionState previous_state = struct_context_.state;
    if (previous_state == next_state) {
        return;
    }
    struct_context_.state = next_state;
    logger_->info("State {} -> {} ({})", previous_state, next_state, reason);
    publish(MissionEventKind::StateChanged, fmt::format("{} -> {}: {}", previous_state, next_state, reason));
}

void MissionController::publish(MissionEventKind kind, std::string description) {
    MissionEvent event{};
    event.kind = kind;
    event.description = std::move(description);
    event.snapshot = snapshot();
    collaborators_.event_bus.publish(event);
}

bool MissionController::reject(const std::string& operation, const std::string& reason) {
    logger_->warn("Cannot {} - {}", operation, reason);
    publish(MissionEventKind::RequestRejected, fmt::format("{} rejected: {}", operation, reason));
    return false;
}

void MissionController::trigger_low_battery() {
    logger_->warn("Warning: Low battery ({:.1f}%)!", struct_context_.resources.battery());
    publish(MissionEventKind::ResourceWarning, fmt::format("battery low at {:.1f}%", struct_context_.resources.battery()));
    transition_to(MissionState::Returning, "low battery");
    return_to_home();
}

void MissionController::trigger_emergency(const std::string& reason) {
    logger_->error("EMERGENCY! {}; stopping all operations and landing immediately", reason);
    transition_to(MissionState::Emergency, reason);
    land();
}

void MissionController::advance_clock(Duration elapsed) {
    struct_context_.mission_clock += elapsed;
}

void MissionController::activate_cleaning() {
    collaborators_.effector.activate_cleaning(profile_.cleaning_activation_duration);
    advance_clock(profile_.cleaning_activation_duration);
    publish(MissionEventKind::CleaningActivated, "spray and wipe pass");
}

bool MissionController::is_on_ground() const noexcept {
    return struct_context_.position.z <= struct_context_.home_position.z;
}

}  // namespace skywash
