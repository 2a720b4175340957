#include "ftr/world/scene_graph.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>

namespace ftr::world {

bool segmentIntersectsAabb(const Vector3& from, const Vector3& to, const Aabb& box,
                           float* tOut, Vector3* normalOut) {
    const Vector3 delta = to - from;
    const Vector3 minB = box.Min();
    const Vector3 maxB = box.Max();

    const std::array<float, 3> origin{from.x, from.y, from.z};
    const std::array<float, 3> dir{delta.x, delta.y, delta.z};
    const std::array<float, 3> lo{minB.x, minB.y, minB.z};
    const std::array<float, 3> hi{maxB.x, maxB.y, maxB.z};

    float tEnter = -std::numeric_limits<float>::infinity();
    float tExit = std::numeric_limits<float>::infinity();
    int enterAxis = -1;
    float enterSign = 0.0f;

    for (int axis = 0; axis < 3; ++axis) {
        if (std::abs(dir[axis]) < 1e-8f) {
            if (origin[axis] < lo[axis] || origin[axis] > hi[axis]) {
                return false;
            }
            continue;
        }
        const float inv = 1.0f / dir[axis];
        float t0 = (lo[axis] - origin[axis]) * inv;
        float t1 = (hi[axis] - origin[axis]) * inv;
        float sign = -1.0f;
        if (t0 > t1) {
            std::swap(t0, t1);
            sign = 1.0f;
        }
        if (t0 > tEnter) {
            tEnter = t0;
            enterAxis = axis;
            enterSign = sign;
        }
        tExit = std::min(tExit, t1);
        if (tEnter > tExit) {
            return false;
        }
    }

    // Segments that start inside the box do not report it.
    if (enterAxis < 0 || tEnter < 0.0f || tEnter > 1.0f) {
        return false;
    }

    if (tOut != nullptr) {
        *tOut = tEnter;
    }
    if (normalOut != nullptr) {
        Vector3 normal;
        if (enterAxis == 0) normal.x = enterSign;
        if (enterAxis == 1) normal.y = enterSign;
        if (enterAxis == 2) normal.z = enterSign;
        *normalOut = normal;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

SceneGraph::SceneGraph(std::string activeScene)
    : activeScene_(std::move(activeScene)) {}

SceneGraph::~SceneGraph() = default;

const SceneGraph::NodeRecord& SceneGraph::record(NodeId node) const {
    auto it = nodes_.find(node);
    if (it == nodes_.end()) {
        throw std::out_of_range("node " + std::to_string(node.value()) + " is not alive");
    }
    return it->second;
}

SceneGraph::NodeRecord& SceneGraph::record(NodeId node) {
    auto it = nodes_.find(node);
    if (it == nodes_.end()) {
        throw std::out_of_range("node " + std::to_string(node.value()) + " is not alive");
    }
    return it->second;
}

NodeId SceneGraph::createNode(std::string name, NodeId parent, const Vector3& position) {
    NodeId id(nextId_++);
    NodeRecord rec;
    rec.name = std::move(name);
    rec.position = position;
    if (parent.isValid()) {
        auto& parentRec = record(parent);
        rec.parent = parent;
        rec.scene = parentRec.scene;
        parentRec.children.push_back(id);
    } else {
        rec.scene = activeScene_;
    }
    nodes_.emplace(id, std::move(rec));
    return id;
}

void SceneGraph::eraseSubtree(NodeId node) {
    auto it = nodes_.find(node);
    if (it == nodes_.end()) {
        return;
    }
    auto children = it->second.children;
    for (NodeId child : children) {
        eraseSubtree(child);
    }
    componentTypes_.erase(node);
    colliders_.erase(node);
    bodies_.erase(node);
    inventories_.erase(node);
    if (mainCamera_ && *mainCamera_ == node) {
        mainCamera_.reset();
    }
    nodes_.erase(node);
}

void SceneGraph::destroyNode(NodeId node) {
    auto it = nodes_.find(node);
    if (it == nodes_.end()) {
        return;
    }
    NodeId parent = it->second.parent;
    if (parent.isValid()) {
        auto parentIt = nodes_.find(parent);
        if (parentIt != nodes_.end()) {
            std::erase(parentIt->second.children, node);
        }
    }
    eraseSubtree(node);
}

void SceneGraph::setTag(NodeId node, std::string tag) {
    record(node).tag = std::move(tag);
}

void SceneGraph::addComponent(NodeId node, std::string typeName) {
    (void)record(node);
    componentTypes_[node].push_back(std::move(typeName));
}

void SceneGraph::setCollider(NodeId node, const Collider& collider) {
    (void)record(node);
    colliders_[node] = collider;
}

void SceneGraph::addRigidbody(NodeId node, const Rigidbody& body) {
    (void)record(node);
    bodies_[node] = body;
}

IInventoryAccess& SceneGraph::attachInventory(NodeId node,
                                              std::unique_ptr<IInventoryAccess> inventory) {
    (void)record(node);
    auto& list = inventories_[node];
    list.push_back(std::move(inventory));
    return *list.back();
}

void SceneGraph::setMainCamera(NodeId node) {
    (void)record(node);
    mainCamera_ = node;
}

void SceneGraph::markPersistent(NodeId node) {
    if (record(node).parent.isValid()) {
        throw std::invalid_argument("only root nodes can be made persistent");
    }
    for (NodeId id : selfAndDescendants(*this, node)) {
        record(id).scene = kPersistentScene;
    }
}

// ---------------------------------------------------------------------------
// Scenes
// ---------------------------------------------------------------------------

void SceneGraph::setActiveScene(std::string scene) {
    activeScene_ = std::move(scene);
}

void SceneGraph::unloadScene(std::string_view scene) {
    std::vector<NodeId> roots;
    for (const auto& [id, rec] : nodes_) {
        if (rec.scene == scene && !rec.parent.isValid()) {
            roots.push_back(id);
        }
    }
    for (NodeId root : roots) {
        destroyNode(root);
    }
}

std::string SceneGraph::sceneOf(NodeId node) const {
    return record(node).scene;
}

std::optional<NodeId> SceneGraph::findByName(std::string_view name) const {
    for (const auto& [id, rec] : nodes_) {
        if (rec.name == name) {
            return id;
        }
    }
    return std::nullopt;
}

std::optional<Vector3> SceneGraph::velocityOf(NodeId node) const {
    auto it = bodies_.find(node);
    if (it == bodies_.end()) {
        return std::nullopt;
    }
    return it->second.velocity;
}

void SceneGraph::setVelocity(NodeId node, const Vector3& velocity) {
    auto it = bodies_.find(node);
    if (it != bodies_.end()) {
        it->second.velocity = velocity;
    }
}

// ---------------------------------------------------------------------------
// IWorldQuery
// ---------------------------------------------------------------------------

std::vector<NodeId> SceneGraph::allNodes() const {
    std::vector<NodeId> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, rec] : nodes_) {
        ids.push_back(id);
    }
    return ids;
}

bool SceneGraph::isAlive(NodeId node) const {
    return nodes_.count(node) > 0;
}

std::string SceneGraph::nodeName(NodeId node) const {
    return record(node).name;
}

NodeId SceneGraph::parentOf(NodeId node) const {
    return record(node).parent;
}

std::vector<NodeId> SceneGraph::childrenOf(NodeId node) const {
    return record(node).children;
}

bool SceneGraph::hasComponent(NodeId node, std::string_view typeName) const {
    auto it = componentTypes_.find(node);
    if (it == componentTypes_.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), typeName) != it->second.end();
}

std::vector<NodeId> SceneGraph::findByComponent(std::string_view typeName) const {
    std::vector<NodeId> result;
    for (const auto& [id, rec] : nodes_) {
        if (hasComponent(id, typeName)) {
            result.push_back(id);
        }
    }
    return result;
}

std::optional<NodeId> SceneGraph::findByTag(std::string_view tag) const {
    for (const auto& [id, rec] : nodes_) {
        if (rec.tag == tag) {
            return id;
        }
    }
    return std::nullopt;
}

std::vector<NodeId> SceneGraph::activeSceneRoots() const {
    std::vector<NodeId> roots;
    for (const auto& [id, rec] : nodes_) {
        if (!rec.parent.isValid() && rec.scene == activeScene_) {
            roots.push_back(id);
        }
    }
    return roots;
}

std::optional<NodeId> SceneGraph::mainCamera() const {
    return mainCamera_;
}

std::string SceneGraph::activeScene() const {
    return activeScene_;
}

Vector3 SceneGraph::positionOf(NodeId node) const {
    return record(node).position;
}

bool SceneGraph::setPosition(NodeId node, const Vector3& position) {
    if (!isAlive(node)) {
        return false;
    }
    const Vector3 delta = position - record(node).position;
    for (NodeId id : selfAndDescendants(*this, node)) {
        record(id).position += delta;
        auto collider = colliders_.find(id);
        if (collider != colliders_.end()) {
            collider->second.bounds.center += delta;
        }
    }
    return true;
}

bool SceneGraph::zeroVelocity(NodeId node) {
    auto it = bodies_.find(node);
    if (it == bodies_.end()) {
        return false;
    }
    it->second.velocity = Vector3::Zero();
    it->second.angularVelocity = Vector3::Zero();
    return true;
}

std::vector<IInventoryAccess*> SceneGraph::inventoriesOf(NodeId node) const {
    std::vector<IInventoryAccess*> result;
    for (NodeId id : selfAndDescendants(*this, node)) {
        auto it = inventories_.find(id);
        if (it == inventories_.end()) {
            continue;
        }
        for (const auto& inventory : it->second) {
            result.push_back(inventory.get());
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// IPhysicsQuery
// ---------------------------------------------------------------------------

std::optional<RaycastHit> SceneGraph::raycast(const Vector3& origin, const Vector3& direction,
                                              float maxDistance,
                                              TriggerInteraction triggers) const {
    const Vector3 dir = direction.Normalized();
    if (dir.LengthSquared() == 0.0f || maxDistance <= 0.0f) {
        return std::nullopt;
    }
    const Vector3 end = origin + dir * maxDistance;

    std::optional<RaycastHit> best;
    for (const auto& [id, collider] : colliders_) {
        if (collider.isTrigger && triggers == TriggerInteraction::Ignore) {
            continue;
        }
        float t = 1.0f;
        Vector3 normal;
        if (!segmentIntersectsAabb(origin, end, collider.bounds, &t, &normal)) {
            continue;
        }
        const float distance = t * maxDistance;
        if (!best || distance < best->distance) {
            RaycastHit hit;
            hit.node = id;
            hit.distance = distance;
            hit.point = origin + dir * distance;
            hit.normal = normal;
            best = hit;
        }
    }
    return best;
}

}  // namespace ftr::world
