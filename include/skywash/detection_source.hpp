// === Detection Source ========================================================
//
// Injectable randomness and window detection. The mission controller decides
// *when* a detection event happens by sampling a RandomSource; the
// DetectionSource decides *what* was seen from the current position.

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <random>

#include "skywash/window.hpp"

namespace skywash {

/** @brief Source of uniform samples in [0, 1). */
class RandomSource {
  public:
    virtual ~RandomSource() = default;
    virtual double next_uniform() = 0;
};

/** @brief Seedable Mersenne Twister implementation of RandomSource. */
class MersenneRandomSource final : public RandomSource {
  public:
    explicit MersenneRandomSource(std::uint64_t seed);
    double next_uniform() override;

  private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> distribution_{0.0, 1.0};
};

/** @brief Perception boundary producing zero-or-one window per invocation. */
class DetectionSource {
  public:
    virtual ~DetectionSource() = default;
    virtual std::optional<WindowObservation> detect(const Position& vehicle_position) = 0;
};

/** @brief Sampling ranges for the randomized detection model, in metres. */
struct DetectionModel final {
    double min_width_m{0.8};
    double max_width_m{2.5};
    double min_height_m{0.8};
    double max_height_m{1.8};
    double lateral_spread_m{5.0};   /**< x offset is drawn from [-spread, spread]. */
    double min_range_m{2.0};        /**< y offset lower bound ahead of the vehicle. */
    double max_range_m{10.0};       /**< y offset upper bound ahead of the vehicle. */
    double depth_spread_m{2.0};     /**< z offset is drawn from [-spread, spread]. */
};

/**
 * @brief Detection source that always reports one randomly placed rectangle
 *        in the scanning plane ahead of the vehicle.
 */
class RandomDetectionSource final : public DetectionSource {
  public:
    explicit RandomDetectionSource(std::uint64_t seed, DetectionModel model = {});
    std::optional<WindowObservation> detect(const Position& vehicle_position) override;

  private:
    double uniform(double lower, double upper);

    std::mt19937_64 engine_;
    DetectionModel model_;
};

}  // namespace skywash
