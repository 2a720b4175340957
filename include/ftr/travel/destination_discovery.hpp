#pragma once

/// @file destination_discovery.hpp
/// @brief Marks destinations visited when the player walks into them.

#include <string>
#include <vector>

#include "ftr/travel/destination.hpp"
#include "ftr/travel/entity_resolver.hpp"

namespace ftr::travel {

/// Periodic proximity scan over unvisited destinations of the active scene.
///
/// A destination with coordinates is discovered when the player is within
/// the discovery radius of them. A destination without coordinates is
/// discovered by being in its scene, and the player's current position
/// becomes its coordinates.
class DestinationDiscovery {
public:
    DestinationDiscovery(const world::IWorldQuery& world, IDestinationRegistry& registry,
                         ResolverOptions resolverOptions, float radius,
                         float scanIntervalSeconds = 1.0f);

    /// Scan once. @return Names discovered by this scan.
    std::vector<std::string> scan();

    /// Accumulate frame time and scan every scan interval.
    void update(float deltaSeconds);

    [[nodiscard]] float radius() const noexcept { return radius_; }

private:
    const world::IWorldQuery& world_;
    IDestinationRegistry& registry_;
    EntityResolver resolver_;
    float radius_;
    float interval_;
    float sinceLastScan_ = 0.0f;
};

}  // namespace ftr::travel
