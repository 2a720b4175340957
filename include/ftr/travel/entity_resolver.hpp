#pragma once

/// @file entity_resolver.hpp
/// @brief Locates the controllable player in an externally owned world graph.
///
/// Resolution runs an ordered chain of independent strategies and stops at
/// the first hit. A strategy whose world query throws counts as "no match";
/// the chain keeps going. Results are never cached: callers resolve afresh for
/// every operation because a scene change may rebuild the graph.

#include <cstdint>
#include <optional>
#include <string_view>

#include "ftr/foundation/travel_result.hpp"
#include "ftr/travel/travel_config.hpp"
#include "ftr/world/world_query.hpp"

namespace ftr::travel {

using world::NodeId;

/// Which link of the chain produced a resolution.
enum class ResolveStrategy : uint8_t {
    NamePrefix,
    RoleComponent,
    Tag,
    SceneRootScan,
    CameraRoot,
    Supplied  ///< Handed in by the caller rather than resolved.
};

constexpr std::string_view toString(ResolveStrategy strategy) {
    switch (strategy) {
        case ResolveStrategy::NamePrefix:    return "name-prefix";
        case ResolveStrategy::RoleComponent: return "role-component";
        case ResolveStrategy::Tag:           return "tag";
        case ResolveStrategy::SceneRootScan: return "scene-root-scan";
        case ResolveStrategy::CameraRoot:    return "camera-root";
        case ResolveStrategy::Supplied:      return "supplied";
    }
    return "unknown";
}

/// Non-owning handle to the player, valid for the current operation only.
struct ResolvedEntity {
    NodeId node;
    ResolveStrategy strategy = ResolveStrategy::NamePrefix;
};

class EntityResolver {
public:
    EntityResolver(const world::IWorldQuery& world, ResolverOptions options);

    /// Run the strategy chain.
    /// @return The hierarchy root found, or EntityNotFound.
    [[nodiscard]] foundation::TravelResult<ResolvedEntity> resolvePlayer() const;

    /// Narrow a coarse root to the node that actually moves: the first node in
    /// the subtree (root included) whose name starts with the player prefix or
    /// that carries a player-role component. Falls back to @p root.
    [[nodiscard]] NodeId resolveActualCharacter(NodeId root) const;

    [[nodiscard]] const ResolverOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::optional<NodeId> byNamePrefix() const;
    [[nodiscard]] std::optional<NodeId> byRoleComponent() const;
    [[nodiscard]] std::optional<NodeId> byTag() const;
    [[nodiscard]] std::optional<NodeId> bySceneRootScan() const;
    [[nodiscard]] std::optional<NodeId> byCameraRoot() const;

    [[nodiscard]] bool looksLikeCharacter(NodeId node) const;

    const world::IWorldQuery& world_;
    ResolverOptions options_;
};

}  // namespace ftr::travel
