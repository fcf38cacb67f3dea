// === Effector ================================================================
//
// Boundary to the physical actuators. The mission core asks the effector to
// fly a straight segment or to run one spray-and-wipe pass; the effector owns
// how long that takes and whether it worked.

#pragma once

#include <cstddef>

#include "skywash/types.hpp"

namespace skywash {

/** @brief Abstract actuator interface consumed by the motion executor and mission controller. */
class Effector {
  public:
    virtual ~Effector() = default;

    /**
     * @brief Fly the straight segment @p from → @p to over @p duration.
     *
     * @return false when the airframe could not complete the segment.
     */
    virtual bool move(const Position& from, const Position& to, Duration duration) = 0;

    /** @brief Run one spray-and-wipe pass lasting @p duration. */
    virtual void activate_cleaning(Duration duration) = 0;
};

/**
 * @brief Effector that always succeeds and accumulates simulated time.
 *
 * Nothing sleeps; the elapsed time is only bookkept so callers can report it.
 */
class SimulatedEffector final : public Effector {
  public:
    bool move(const Position& from, const Position& to, Duration duration) override;
    void activate_cleaning(Duration duration) override;

    [[nodiscard]] std::size_t move_count() const noexcept;
    [[nodiscard]] std::size_t cleaning_count() const noexcept;
    [[nodiscard]] Duration busy_time() const noexcept;

  private:
    std::size_t count_moves_{0};
    std::size_t count_cleanings_{0};
    Duration busy_time_{0.0};
};

}  // namespace skywash
