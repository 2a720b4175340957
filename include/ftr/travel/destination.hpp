#pragma once

/// @file destination.hpp
/// @brief Destination record and the registry capability the orchestrator uses.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ftr/foundation/travel_result.hpp"
#include "ftr/world/math_types.hpp"

namespace ftr::travel {

using world::Vector3;

/// A named travel target.
///
/// A destination without coordinates can be listed but is never teleportable,
/// whatever its enabled or visited state.
struct Destination {
    std::string name;
    std::optional<Vector3> coordinates;
    std::optional<int64_t> price;           ///< nullopt = global default price.
    bool enabled = true;
    bool visited = false;
    std::optional<std::string> sceneId;     ///< nullopt = same-scene travel.
    std::optional<std::string> description;
    std::optional<std::string> targetNodeName;  ///< Arrival anchor inside the scene.

    [[nodiscard]] bool isActionable() const noexcept { return coordinates.has_value(); }

    /// Whether the destination is offered to the player at all.
    [[nodiscard]] bool isTravelable() const noexcept { return visited || enabled; }

    [[nodiscard]] int64_t effectivePrice(int64_t defaultPrice) const noexcept {
        return price.value_or(defaultPrice);
    }
};

/// Supplies destination records and receives visited-state updates.
class IDestinationRegistry {
public:
    virtual ~IDestinationRegistry() = default;

    [[nodiscard]] virtual std::optional<Destination> get(std::string_view name) const = 0;

    /// Flag @p name visited. When @p coordinates is set and the destination had
    /// none, they are stored as its coordinates.
    virtual foundation::TravelResult<void> markVisited(
        std::string_view name, std::optional<Vector3> coordinates) = 0;

    /// Destinations that are visited or enabled, in registration order.
    [[nodiscard]] virtual std::vector<Destination> listTravelable() const = 0;

    /// Every destination, in registration order.
    [[nodiscard]] virtual std::vector<Destination> all() const = 0;
};

}  // namespace ftr::travel
