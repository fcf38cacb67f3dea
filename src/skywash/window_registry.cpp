#include "skywash/window_registry.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <set>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "skywash/formatting.hpp"
#include "skywash/geometry.hpp"
#include "skywash/logging.hpp"

namespace skywash {

namespace {

using PositionKey = std::array<std::string, 3>;

/**
 * @brief Decimal rendering of @p value rounded to 0.1 m.
 *
 * Rounds the exact binary value half-to-even, so 0.15 (stored just below)
 * becomes "0.1" and an exact 0.25 becomes "0.2". Negative zero shares the
 * key of zero.
 */
std::string rounded_decimetres(double value) {
    std::string str_rounded = fmt::format("{:.1f}", value);
    if (str_rounded == "-0.0") {
        str_rounded = "0.0";
    }
    return str_rounded;
}

PositionKey quantize(const Position& position) {
    return PositionKey{
        rounded_decimetres(position.x),
        rounded_decimetres(position.y),
        rounded_decimetres(position.z)
    };
}

bool is_usable(const WindowObservation& observation) noexcept {
    return std::isfinite(observation.origin.x) && std::isfinite(observation.origin.y) && std::isfinite(observation.origin.z)
        && std::isfinite(observation.width_m) && std::isfinite(observation.height_m)
        && observation.width_m > 0.0 && observation.height_m > 0.0;
}

}  // namespace

std::optional<WindowId> WindowRegistry::register_observation(const WindowObservation& observation) {
    auto logger = get_logger();
    if (!is_usable(observation)) {
        logger->warn("Discarding degenerate window observation at {} ({} x {} m)",
                     observation.origin, observation.width_m, observation.height_m);
        return std::nullopt;
    }

    const WindowId id = next_identifier_++;
    list_windows_.push_back(make_window(id, corners_from_observation(observation)));
    logger->info("Detected window {} at position {}", id, list_windows_.back().center);
    return id;
}

std::size_t WindowRegistry::deduplicate() {
    std::set<PositionKey> set_seen_keys;
    std::vector<Window> list_unique_windows;
    list_unique_windows.reserve(list_windows_.size());
    for (Window& window : list_windows_) {
        if (set_seen_keys.insert(quantize(window.center)).second) {
            list_unique_windows.push_back(std::move(window));
        }
    }
    const std::size_t removed = list_windows_.size() - list_unique_windows.size();
    list_windows_ = std::move(list_unique_windows);

    auto logger = get_logger();
    logger->info("Identified {} unique windows ({} duplicates dropped)", list_windows_.size(), removed);
    return removed;
}

std::size_t WindowRegistry::mark_cleaned_near(const Position& position, double radius_m) {
    std::size_t matched = 0;
    for (Window& window : list_windows_) {
        if (distance_m(window.center, position) < radius_m) {
            window.cleaned = true;
            ++matched;
        }
    }
    return matched;
}

const std::vector<Window>& WindowRegistry::windows() const noexcept {
    return list_windows_;
}

std::optional<Window> WindowRegistry::find(WindowId id) const {
    const auto iterator_window = std::find_if(list_windows_.begin(), list_windows_.end(), [id](const Window& window) {
        return window.id == id;
    });
    if (iterator_window == list_windows_.end()) {
        return std::nullopt;
    }
    return *iterator_window;
}

std::size_t WindowRegistry::size() const noexcept {
    return list_windows_.size();
}

bool WindowRegistry::empty() const noexcept {
    return list_windows_.empty();
}

std::size_t WindowRegistry::cleaned_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(list_windows_.begin(), list_windows_.end(), [](const Window& window) {
        return window.cleaned;
    }));
}

}  // namespace skywash
