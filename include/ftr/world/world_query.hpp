#pragma once

/// @file world_query.hpp
/// @brief Capability interface over the externally owned live world graph.
///
/// The travel core never owns world objects. Every lookup goes through
/// IWorldQuery, and any method may throw std::exception when the host's
/// graph is in an inconsistent state (mid scene swap, destroyed objects).
/// Callers catch at their own boundary.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ftr/foundation/types.hpp"
#include "ftr/world/inventory_access.hpp"
#include "ftr/world/math_types.hpp"

namespace ftr::world {

using foundation::NodeId;

class IWorldQuery {
public:
    virtual ~IWorldQuery() = default;

    // ── Graph traversal ─────────────────────────────────────────────────

    /// Every live node, in creation order.
    [[nodiscard]] virtual std::vector<NodeId> allNodes() const = 0;
    [[nodiscard]] virtual bool isAlive(NodeId node) const = 0;
    [[nodiscard]] virtual std::string nodeName(NodeId node) const = 0;

    /// Parent of @p node, or an invalid id for a hierarchy root.
    [[nodiscard]] virtual NodeId parentOf(NodeId node) const = 0;
    [[nodiscard]] virtual std::vector<NodeId> childrenOf(NodeId node) const = 0;

    // ── Lookups ─────────────────────────────────────────────────────────

    [[nodiscard]] virtual bool hasComponent(NodeId node, std::string_view typeName) const = 0;
    [[nodiscard]] virtual std::vector<NodeId> findByComponent(std::string_view typeName) const = 0;
    [[nodiscard]] virtual std::optional<NodeId> findByTag(std::string_view tag) const = 0;
    [[nodiscard]] virtual std::vector<NodeId> activeSceneRoots() const = 0;
    [[nodiscard]] virtual std::optional<NodeId> mainCamera() const = 0;
    [[nodiscard]] virtual std::string activeScene() const = 0;

    // ── Spatial state ───────────────────────────────────────────────────

    [[nodiscard]] virtual Vector3 positionOf(NodeId node) const = 0;

    /// Move @p node to a world position; descendants keep their offsets.
    virtual bool setPosition(NodeId node, const Vector3& position) = 0;

    /// Clear linear and angular velocity. False if the node has no body.
    virtual bool zeroVelocity(NodeId node) = 0;

    // ── Inventory ───────────────────────────────────────────────────────

    /// Inventory components on @p node and its descendants.
    [[nodiscard]] virtual std::vector<IInventoryAccess*> inventoriesOf(NodeId node) const = 0;
};

// ── Hierarchy helpers ───────────────────────────────────────────────────

/// Walk parents up to the hierarchy root.
[[nodiscard]] NodeId rootOf(const IWorldQuery& world, NodeId node);

/// @p node followed by all its descendants, depth first.
[[nodiscard]] std::vector<NodeId> selfAndDescendants(const IWorldQuery& world, NodeId node);

/// True if @p node is @p ancestor or lies beneath it.
[[nodiscard]] bool isInHierarchy(const IWorldQuery& world, NodeId node, NodeId ancestor);

}  // namespace ftr::world
