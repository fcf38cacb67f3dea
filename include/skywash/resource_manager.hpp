// === Resource Manager ========================================================
//
// Battery and cleaning-fluid bookkeeping. Levels are percentages clamped to
// [0, 100]; they only rise through an explicit recharge or refill.

#pragma once

namespace skywash {

/** @brief Threshold percentages used by the level predicates. */
struct ResourceThresholds final {
    double battery_critical_percent{10.0};
    double battery_low_percent{15.0};
    double fluid_low_percent{5.0};
};

/** @brief Tracks consumable levels for a single vehicle. */
class ResourceManager final {
  public:
    explicit ResourceManager(ResourceThresholds thresholds = {});

    [[nodiscard]] double battery() const noexcept;
    [[nodiscard]] double fluid() const noexcept;

    /** @throws std::invalid_argument when @p amount_percent is negative. */
    void deplete_battery(double amount_percent);
    /** @throws std::invalid_argument when @p amount_percent is negative. */
    void deplete_fluid(double amount_percent);

    void recharge() noexcept;
    void refill() noexcept;

    [[nodiscard]] bool is_battery_critical() const noexcept;
    [[nodiscard]] bool is_battery_low() const noexcept;
    [[nodiscard]] bool is_fluid_low() const noexcept;

  private:
    ResourceThresholds thresholds_;
    double battery_percent_;
    double fluid_percent_;
};

}  // namespace skywash
