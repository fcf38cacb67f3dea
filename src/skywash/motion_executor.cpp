#include "skywash/motion_executor.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "skywash/formatting.hpp"
#include "skywash/geometry.hpp"
#include "skywash/logging.hpp"

namespace skywash {

namespace {

/** @brief Segment counts at or beyond this bound cannot be held in a std::uint64_t. */
constexpr double k_max_representable_segments{static_cast<double>(std::numeric_limits<std::uint64_t>::max())};

}  // namespace

MotionExecutor::MotionExecutor(MotionConfig config, Effector& effector)
    : config_(config),
      effector_(effector) {
    if (config_.cruise_speed_mps <= 0.0) {
        throw std::invalid_argument("MotionExecutor cruise speed must be positive");
    }
    if (config_.segment_length_m <= 0.0) {
        throw std::invalid_argument("MotionExecutor segment length must be positive");
    }
    if (config_.segmentation_threshold_m < config_.segment_length_m) {
        throw std::invalid_argument("MotionExecutor segmentation threshold must not be shorter than a segment");
    }
}

MoveOutcome MotionExecutor::move_to(const Position& current, const Position& target) {
    auto logger = get_logger();
    if (exceeds_ceiling(target)) {
        logger->warn("Cannot exceed max altitude of {}m (target {})", config_.max_altitude_m, target);
        return MoveOutcome{false, current, Duration{0.0}};
    }

    const double distance = distance_m(current, target);
    if (distance <= config_.segmentation_threshold_m) {
        return move_direct(current, target);
    }

    const double whole_segments = std::floor(distance / config_.segment_length_m);
    if (!std::isfinite(whole_segments) || whole_segments >= k_max_representable_segments) {
        logger->warn("Cannot segment a movement of {:.2f}m toward {}", distance, target);
        return MoveOutcome{false, current, Duration{0.0}};
    }
    const std::uint64_t steps = static_cast<std::uint64_t>(whole_segments) + 1;
    logger->debug("Movement of {:.2f}m exceeds {}m; splitting into {} segments",
                  distance, config_.segmentation_threshold_m, steps);

    MoveOutcome outcome{true, current, Duration{0.0}};
    for (std::uint64_t step = 1; step <= steps; ++step) {
        const Position waypoint = step == steps
            ? target
            : interpolate(current, target, static_cast<double>(step) / static_cast<double>(steps));
        const MoveOutcome step_outcome = move_direct(outcome.position, waypoint);
        outcome.elapsed += step_outcome.elapsed;
        outcome.position = step_outcome.position;
        if (!step_outcome.succeeded) {
            logger->warn("Segment {}/{} toward {} failed at {}", step, steps, target, outcome.position);
            outcome.succeeded = false;
            return outcome;
        }
    }
    return outcome;
}

bool MotionExecutor::exceeds_ceiling(const Position& target) const noexcept {
    return target.y > config_.max_altitude_m;
}

MoveOutcome MotionExecutor::move_direct(const Position& current, const Position& target) {
    if (exceeds_ceiling(target)) {
        return MoveOutcome{false, current, Duration{0.0}};
    }
    const double distance = distance_m(current, target);
    const Duration move_time{distance / config_.cruise_speed_mps};
    auto logger = get_logger();
    logger->debug("Moving to {} (distance: {:.2f}m, time: {:.1f}s)", target, distance, move_time.count());
    if (!effector_.move(current, target, move_time)) {
        return MoveOutcome{false, current, Duration{0.0}};
    }
    return MoveOutcome{true, target, move_time};
}

}  // namespace skywash
