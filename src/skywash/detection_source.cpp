#include "skywash/detection_source.hpp"

#include <stdexcept>

namespace skywash {

MersenneRandomSource::MersenneRandomSource(std::uint64_t seed)
    : engine_(seed) {}

double MersenneRandomSource::next_uniform() {
    return distribution_(engine_);
}

RandomDetectionSource::RandomDetectionSource(std::uint64_t seed, DetectionModel model)
    : engine_(seed),
      model_(model) {
    if (model_.min_width_m <= 0.0 || model_.max_width_m < model_.min_width_m) {
        throw std::invalid_argument("DetectionModel width range is invalid");
    }
    if (model_.min_height_m <= 0.0 || model_.max_height_m < model_.min_height_m) {
        throw std::invalid_argument("DetectionModel height range is invalid");
    }
    if (model_.max_range_m < model_.min_range_m) {
        throw std::invalid_argument("DetectionModel range bounds are invalid");
    }
}

std::optional<WindowObservation> RandomDetectionSource::detect(const Position& vehicle_position) {
    WindowObservation observation{};
    observation.width_m = uniform(model_.min_width_m, model_.max_width_m);
    observation.height_m = uniform(model_.min_height_m, model_.max_height_m);
    observation.origin = Position{
        vehicle_position.x + uniform(-model_.lateral_spread_m, model_.lateral_spread_m),
        vehicle_position.y + uniform(model_.min_range_m, model_.max_range_m),
        vehicle_position.z + uniform(-model_.depth_spread_m, model_.depth_spread_m)
    };
    return observation;
}

double RandomDetectionSource::uniform(double lower, double upper) {
    std::uniform_real_distribution<double> distribution{lower, upper};
    return distribution(engine_);
}

}  // namespace skywash
