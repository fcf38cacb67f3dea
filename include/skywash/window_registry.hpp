// === Window Registry =========================================================
//
// Stores the windows detected during a scan and consolidates duplicates that
// were observed more than once. Duplicates are identified by rounding each
// window center to 0.1 m per axis; the first-seen window per cell is retained.

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "skywash/window.hpp"

namespace skywash {

/** @brief Ordered collection of detected windows with spatial deduplication. */
class WindowRegistry final {
  public:
    /**
     * @brief Register an observation, assigning the next identifier.
     *
     * Identifiers follow detection order starting at 1 and are never reused,
     * even after deduplication removes entries.
     *
     * @return The new window identifier, or std::nullopt when the observation
     *         does not describe a usable rectangle.
     */
    std::optional<WindowId> register_observation(const WindowObservation& observation);

    /** @brief Drop every window whose quantized center was already seen; returns the number removed. */
    std::size_t deduplicate();

    /** @brief Mark windows whose center lies strictly within @p radius_m of @p position; returns how many matched. */
    std::size_t mark_cleaned_near(const Position& position, double radius_m);

    /** @brief Windows in registration order. */
    [[nodiscard]] const std::vector<Window>& windows() const noexcept;
    [[nodiscard]] std::optional<Window> find(WindowId id) const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] std::size_t cleaned_count() const noexcept;

  private:
    std::vector<Window> list_windows_;
    WindowId next_identifier_{1};
};

}  // namespace skywash
