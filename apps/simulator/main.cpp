#include <cstdlib>
#include <iostream>

#include <spdlog/spdlog.h>

#include "skywash/configuration.hpp"
#include "skywash/detection_source.hpp"
#include "skywash/effector.hpp"
#include "skywash/formatting.hpp"
#include "skywash/logging.hpp"
#include "skywash/mission_controller.hpp"
#include "skywash/mission_event_bus.hpp"
#include "skywash/version.hpp"

namespace {

void narrate_events(skywash::MissionEventBus& bus) {
    auto logger = skywash::get_logger();
    while (const auto event = bus.try_consume()) {
        logger->debug("[{} t={:.1f}s] {} | battery {:.1f}% fluid {:.1f}% at {}",
                      skywash::to_string(event->kind),
                      event->snapshot.mission_clock.count(),
                      event->description,
                      event->snapshot.battery_percent,
                      event->snapshot.fluid_percent,
                      event->snapshot.position);
    }
}

}  // namespace

int main() {
    using namespace skywash;

    try {
        const Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);

        auto logger = get_logger();
        logger->info("skywash simulator {} starting", k_version);

        SimulatedEffector effector{};
        RandomDetectionSource detection_source{configuration.random_seed};
        MersenneRandomSource random_source{configuration.random_seed + 1};
        MissionEventBus event_bus{};

        MissionController controller{
            configuration.profile,
            configuration.home_position,
            MissionCollaborators{effector, detection_source, random_source, event_bus}
        };

        if (!controller.takeoff() || !controller.scan(configuration.scan_duration)) {
            narrate_events(event_bus);
            logger->error("Mission could not start scanning");
            return EXIT_FAILURE;
        }
        narrate_events(event_bus);

        if (!controller.plan_cleaning_path()) {
            logger->warn("No windows found during the scan; nothing to clean");
        } else if (!controller.execute_cleaning()) {
            logger->error("Cleaning aborted in state {}", controller.state());
        }
        narrate_events(event_bus);

        controller.recharge();
        controller.refill_fluid();
        if (controller.state() == MissionState::Emergency && !controller.clear_emergency()) {
            logger->error("Emergency could not be cleared; vehicle remains grounded");
        }
        narrate_events(event_bus);

        const MissionSnapshot summary = controller.snapshot();
        logger->info("Mission complete. Cleaned {}/{} windows in {:.1f}s of mission time",
                     summary.cleaned_window_count,
                     summary.window_count,
                     summary.mission_clock.count());
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
