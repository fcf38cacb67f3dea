#include "skywash/mission_event_bus.hpp"

namespace skywash {

std::string_view to_string(MissionEventKind kind) noexcept {
    switch (kind) {
        case MissionEventKind::StateChanged:
            return "state-changed";
        case MissionEventKind::WindowDetected:
            return "window-detected";
        case MissionEventKind::WaypointReached:
            return "waypoint-reached";
        case MissionEventKind::CleaningActivated:
            return "cleaning-activated";
        case MissionEventKind::ResourceWarning:
            return "resource-warning";
        case MissionEventKind::RequestRejected:
            return "request-rejected";
    }
    return "unknown";
}

void MissionEventBus::publish(const MissionEvent& event) {
    std::scoped_lock lock(mutex_);
    queue_events_.push(event);
}

std::optional<MissionEvent> MissionEventBus::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_events_.empty()) {
        return std::nullopt;
    }
    MissionEvent event = queue_events_.front();
    queue_events_.pop();
    return event;
}

std::size_t MissionEventBus::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_events_.size();
}

}  // namespace skywash
