#include "skywash/effector.hpp"

#include <spdlog/spdlog.h>

#include "skywash/formatting.hpp"
#include "skywash/logging.hpp"

namespace skywash {

bool SimulatedEffector::move(const Position& from, const Position& to, Duration duration) {
    auto logger = get_logger();
    logger->debug("Effector flying {} -> {} in {:.1f}s", from, to, duration.count());
    ++count_moves_;
    busy_time_ += duration;
    return true;
}

void SimulatedEffector::activate_cleaning(Duration duration) {
    auto logger = get_logger();
    logger->debug("Activating cleaning system - spraying fluid and wiping");
    ++count_cleanings_;
    busy_time_ += duration;
}

std::size_t SimulatedEffector::move_count() const noexcept {
    return count_moves_;
}

std::size_t SimulatedEffector::cleaning_count() const noexcept {
    return count_cleanings_;
}

Duration SimulatedEffector::busy_time() const noexcept {
    return busy_time_;
}

}  // namespace skywash
