#pragma once

/// @file scene_graph.hpp
/// @brief In-memory world graph implementing IWorldQuery and IPhysicsQuery.
///
/// SceneGraph is the host world used by the simulator executable and by the
/// tests. Each node belongs to a scene; nodes moved to the persistent scene
/// survive unloadScene(). Component data lives in one map per component
/// type, keyed by node id.

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ftr/world/physics_query.hpp"
#include "ftr/world/world_components.hpp"
#include "ftr/world/world_query.hpp"

namespace ftr::world {

class SceneGraph : public IWorldQuery, public IPhysicsQuery {
public:
    explicit SceneGraph(std::string activeScene = "Main");
    ~SceneGraph() override;

    SceneGraph(const SceneGraph&) = delete;
    SceneGraph& operator=(const SceneGraph&) = delete;

    // ── Construction ────────────────────────────────────────────────────

    /// Create a node at @p position. A child joins its parent's scene; a
    /// root joins the active scene.
    NodeId createNode(std::string name, NodeId parent = NodeId{},
                      const Vector3& position = Vector3::Zero());

    /// Destroy a node and its whole subtree.
    void destroyNode(NodeId node);

    void setTag(NodeId node, std::string tag);
    void addComponent(NodeId node, std::string typeName);
    void setCollider(NodeId node, const Collider& collider);
    void addRigidbody(NodeId node, const Rigidbody& body = {});
    IInventoryAccess& attachInventory(NodeId node, std::unique_ptr<IInventoryAccess> inventory);
    void setMainCamera(NodeId node);

    /// Move a root node (and its subtree) to the persistent scene.
    void markPersistent(NodeId node);

    // ── Scenes ──────────────────────────────────────────────────────────

    void setActiveScene(std::string scene);

    /// Destroy every node that belongs to @p scene.
    void unloadScene(std::string_view scene);

    [[nodiscard]] std::string sceneOf(NodeId node) const;
    [[nodiscard]] std::size_t nodeCount() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::optional<NodeId> findByName(std::string_view name) const;
    [[nodiscard]] std::optional<Vector3> velocityOf(NodeId node) const;
    void setVelocity(NodeId node, const Vector3& velocity);

    // ── IWorldQuery ─────────────────────────────────────────────────────

    [[nodiscard]] std::vector<NodeId> allNodes() const override;
    [[nodiscard]] bool isAlive(NodeId node) const override;
    [[nodiscard]] std::string nodeName(NodeId node) const override;
    [[nodiscard]] NodeId parentOf(NodeId node) const override;
    [[nodiscard]] std::vector<NodeId> childrenOf(NodeId node) const override;
    [[nodiscard]] bool hasComponent(NodeId node, std::string_view typeName) const override;
    [[nodiscard]] std::vector<NodeId> findByComponent(std::string_view typeName) const override;
    [[nodiscard]] std::optional<NodeId> findByTag(std::string_view tag) const override;
    [[nodiscard]] std::vector<NodeId> activeSceneRoots() const override;
    [[nodiscard]] std::optional<NodeId> mainCamera() const override;
    [[nodiscard]] std::string activeScene() const override;
    [[nodiscard]] Vector3 positionOf(NodeId node) const override;
    bool setPosition(NodeId node, const Vector3& position) override;
    bool zeroVelocity(NodeId node) override;
    [[nodiscard]] std::vector<IInventoryAccess*> inventoriesOf(NodeId node) const override;

    // ── IPhysicsQuery ───────────────────────────────────────────────────

    [[nodiscard]] std::optional<RaycastHit> raycast(
        const Vector3& origin, const Vector3& direction, float maxDistance,
        TriggerInteraction triggers) const override;

private:
    struct NodeRecord {
        std::string name;
        std::string scene;
        std::string tag;
        NodeId parent;
        std::vector<NodeId> children;
        Vector3 position;
    };

    [[nodiscard]] const NodeRecord& record(NodeId node) const;
    NodeRecord& record(NodeId node);
    void eraseSubtree(NodeId node);

    uint32_t nextId_ = 1;
    std::string activeScene_;
    std::optional<NodeId> mainCamera_;

    // Ordered so iteration follows creation order.
    std::map<NodeId, NodeRecord> nodes_;
    std::unordered_map<NodeId, std::vector<std::string>> componentTypes_;
    std::unordered_map<NodeId, Collider> colliders_;
    std::unordered_map<NodeId, Rigidbody> bodies_;
    std::unordered_map<NodeId, std::vector<std::unique_ptr<IInventoryAccess>>> inventories_;
};

/// Segment-vs-box slab test. On hit, @p tOut receives the entry parameter in
/// [0, 1] along from→to and @p normalOut the face normal.
bool segmentIntersectsAabb(const Vector3& from, const Vector3& to, const Aabb& box,
                           float* tOut = nullptr, Vector3* normalOut = nullptr);

}  // namespace ftr::world
