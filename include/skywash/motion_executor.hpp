// === Motion Executor =========================================================
//
// Safe point-to-point motion on top of an Effector. Enforces the altitude
// ceiling and splits long moves into equal straight sub-steps so that no
// single effector command spans more than the segmentation threshold.

#pragma once

#include "skywash/effector.hpp"
#include "skywash/types.hpp"

namespace skywash {

/** @brief Limits governing point-to-point moves. */
struct MotionConfig final {
    double cruise_speed_mps{1.0};
    double max_altitude_m{50.0};
    double segmentation_threshold_m{10.0};
    double segment_length_m{5.0};
};

/** @brief Result of a move request. */
struct MoveOutcome final {
    bool succeeded{};   /**< True when the target was reached. */
    Position position;  /**< Where the vehicle ended up (the target on success). */
    Duration elapsed{}; /**< Simulated flight time spent, including partial progress. */
};

/** @brief Executes moves through an effector while enforcing motion limits. */
class MotionExecutor final {
  public:
    /**
     * @throws std::invalid_argument on non-positive speed or segment lengths.
     */
    MotionExecutor(MotionConfig config, Effector& effector);

    /**
     * @brief Move from @p current to @p target.
     *
     * The ceiling check compares the target's y, not z, against the maximum
     * altitude; a violating target fails before any motion. Moves longer than
     * the segmentation threshold run as floor(distance / segment_length) + 1
     * equal sub-steps interpolated from @p current; the first failing sub-step
     * stops the move and leaves the position at the last reached sub-step.
     * A distance whose sub-step count does not fit in 64 bits, or is not
     * finite, fails before any motion.
     */
    [[nodiscard]] MoveOutcome move_to(const Position& current, const Position& target);

  private:
    [[nodiscard]] bool exceeds_ceiling(const Position& target) const noexcept;
    [[nodiscard]] MoveOutcome move_direct(const Position& current, const Position& target);

    MotionConfig config_;
    Effector& effector_;
};

}  // namespace skywash
