// === Mission Event Bus =======================================================
//
// Provides a minimal thread-safe queue for distributing mission events from
// the mission controller to presentation or monitoring consumers.

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>

#include "skywash/mission_snapshot.hpp"

namespace skywash {

/** @brief Category of a published mission event. */
enum class MissionEventKind {
    StateChanged,       /**< The mission state machine moved to a new state. */
    WindowDetected,     /**< A scan tick registered a window observation. */
    WaypointReached,    /**< A cleaning waypoint was flown successfully. */
    CleaningActivated,  /**< The spray-and-wipe system ran. */
    ResourceWarning,    /**< Battery or fluid crossed a threshold. */
    RequestRejected     /**< An operation was refused because a precondition failed. */
};

[[nodiscard]] std::string_view to_string(MissionEventKind kind) noexcept;

/** @brief Wrapper representing a single mission publication. */
struct MissionEvent final {
    MissionEventKind kind{MissionEventKind::StateChanged};
    std::string description{};
    MissionSnapshot snapshot{};
};

/** @brief Thread-safe FIFO used to exchange mission events. */
class MissionEventBus final {
  public:
    /** @brief Publish a mission event to all consumers. */
    void publish(const MissionEvent& event);
    /** @brief Attempt to consume a pending event without blocking. */
    [[nodiscard]] std::optional<MissionEvent> try_consume();
    /** @brief Number of events waiting to be consumed. */
    [[nodiscard]] std::size_t pending() const;

  private:
    mutable std::mutex mutex_;
    std::queue<MissionEvent> queue_events_;
};

}  // namespace skywash
