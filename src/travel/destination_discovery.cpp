#include "ftr/travel/destination_discovery.hpp"

#include <exception>

#include "ftr/foundation/travel_logger.hpp"

namespace ftr::travel {

using foundation::LogCategory;

DestinationDiscovery::DestinationDiscovery(const world::IWorldQuery& world,
                                           IDestinationRegistry& registry,
                                           ResolverOptions resolverOptions, float radius,
                                           float scanIntervalSeconds)
    : world_(world),
      registry_(registry),
      resolver_(world, std::move(resolverOptions)),
      radius_(radius),
      interval_(scanIntervalSeconds) {}

std::vector<std::string> DestinationDiscovery::scan() {
    std::vector<std::string> discovered;

    auto player = resolver_.resolvePlayer();
    if (!player) {
        return discovered;
    }

    Vector3 position;
    std::string scene;
    try {
        position = world_.positionOf(resolver_.resolveActualCharacter(player.value().node));
        scene = world_.activeScene();
    } catch (const std::exception& e) {
        FTR_LOG_DEBUG(LogCategory::Registry, std::string("discovery scan skipped: ") + e.what());
        return discovered;
    }

    for (const auto& dest : registry_.all()) {
        if (dest.visited || !dest.sceneId || *dest.sceneId != scene) {
            continue;
        }

        std::optional<Vector3> captured;
        if (dest.coordinates) {
            if (world::Distance(*dest.coordinates, position) > radius_) {
                continue;
            }
        } else {
            captured = position;
        }

        auto marked = registry_.markVisited(dest.name, captured);
        if (!marked) {
            FTR_LOG_WARN(LogCategory::Registry, "discovery of " + dest.name +
                                                    " not stored: " +
                                                    std::string(marked.error().message()));
        }
        FTR_LOG_INFO(LogCategory::Registry, "discovered destination " + dest.name);
        discovered.push_back(dest.name);
    }
    return discovered;
}

void DestinationDiscovery::update(float deltaSeconds) {
    sinceLastScan_ += deltaSeconds;
    if (sinceLastScan_ < interval_) {
        return;
    }
    sinceLastScan_ = 0.0f;
    (void)scan();
}

}  // namespace ftr::travel
