#include "skywash/resource_manager.hpp"

#include <algorithm>
#include <stdexcept>

namespace skywash {

namespace {
constexpr double k_full_percent{100.0};
constexpr double k_empty_percent{0.0};

double depleted(double level_percent, double amount_percent) {
    if (amount_percent < 0.0) {
        throw std::invalid_argument("Resource depletion amount cannot be negative");
    }
    return std::clamp(level_percent - amount_percent, k_empty_percent, k_full_percent);
}
}  // namespace

ResourceManager::ResourceManager(ResourceThresholds thresholds)
    : thresholds_(thresholds),
      battery_percent_(k_full_percent),
      fluid_percent_(k_full_percent) {}

double ResourceManager::battery() const noexcept {
    return battery_percent_;
}

double ResourceManager::fluid() const noexcept {
    return fluid_percent_;
}

void ResourceManager::deplete_battery(double amount_percent) {
    battery_percent_ = depleted(battery_percent_, amount_percent);
}

void ResourceManager::deplete_fluid(double amount_percent) {
    fluid_percent_ = depleted(fluid_percent_, amount_percent);
}

void ResourceManager::recharge() noexcept {
    battery_percent_ = k_full_percent;
}

void ResourceManager::refill() noexcept {
    fluid_percent_ = k_full_percent;
}

bool ResourceManager::is_battery_critical() const noexcept {
    return battery_percent_ < thresholds_.battery_critical_percent;
}

bool ResourceManager::is_battery_low() const noexcept {
    return battery_percent_ < thresholds_.battery_low_percent;
}

bool ResourceManager::is_fluid_low() const noexcept {
    return fluid_percent_ < thresholds_.fluid_low_percent;
}

}  // namespace skywash
