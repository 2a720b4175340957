#pragma once

/// @file travel_test_support.hpp
/// @brief Fakes shared by the travel unit tests.

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ftr/travel/scene_loader.hpp"
#include "ftr/world/physics_query.hpp"
#include "ftr/world/scene_graph.hpp"

namespace ftr::test {

using world::IInventoryAccess;
using world::ItemStack;
using world::NodeId;
using world::Vector3;

// ---------------------------------------------------------------------------
// ThrowingWorld: forwards to a SceneGraph, optionally throwing per query
// ---------------------------------------------------------------------------

struct WorldFaults {
    bool allNodes = false;
    bool findByComponent = false;
    bool findByTag = false;
    bool activeSceneRoots = false;
    bool mainCamera = false;
    bool inventoriesOf = false;
    bool setPosition = false;
};

class ThrowingWorld : public world::IWorldQuery {
public:
    explicit ThrowingWorld(world::SceneGraph& graph) : graph_(graph) {}

    WorldFaults faults;

    [[nodiscard]] std::vector<NodeId> allNodes() const override {
        fail(faults.allNodes, "allNodes");
        return graph_.allNodes();
    }
    [[nodiscard]] bool isAlive(NodeId node) const override { return graph_.isAlive(node); }
    [[nodiscard]] std::string nodeName(NodeId node) const override {
        return graph_.nodeName(node);
    }
    [[nodiscard]] NodeId parentOf(NodeId node) const override { return graph_.parentOf(node); }
    [[nodiscard]] std::vector<NodeId> childrenOf(NodeId node) const override {
        return graph_.childrenOf(node);
    }
    [[nodiscard]] bool hasComponent(NodeId node, std::string_view typeName) const override {
        return graph_.hasComponent(node, typeName);
    }
    [[nodiscard]] std::vector<NodeId> findByComponent(std::string_view typeName) const override {
        fail(faults.findByComponent, "findByComponent");
        return graph_.findByComponent(typeName);
    }
    [[nodiscard]] std::optional<NodeId> findByTag(std::string_view tag) const override {
        fail(faults.findByTag, "findByTag");
        return graph_.findByTag(tag);
    }
    [[nodiscard]] std::vector<NodeId> activeSceneRoots() const override {
        fail(faults.activeSceneRoots, "activeSceneRoots");
        return graph_.activeSceneRoots();
    }
    [[nodiscard]] std::optional<NodeId> mainCamera() const override {
        fail(faults.mainCamera, "mainCamera");
        return graph_.mainCamera();
    }
    [[nodiscard]] std::string activeScene() const override { return graph_.activeScene(); }
    [[nodiscard]] Vector3 positionOf(NodeId node) const override {
        return graph_.positionOf(node);
    }
    bool setPosition(NodeId node, const Vector3& position) override {
        fail(faults.setPosition, "setPosition");
        return graph_.setPosition(node, position);
    }
    bool zeroVelocity(NodeId node) override { return graph_.zeroVelocity(node); }
    [[nodiscard]] std::vector<IInventoryAccess*> inventoriesOf(NodeId node) const override {
        fail(faults.inventoriesOf, "inventoriesOf");
        return graph_.inventoriesOf(node);
    }

private:
    static void fail(bool enabled, const char* what) {
        if (enabled) {
            throw std::runtime_error(std::string(what) + ": world is being torn down");
        }
    }

    world::SceneGraph& graph_;
};

// ---------------------------------------------------------------------------
// ThrowingPhysics
// ---------------------------------------------------------------------------

class ThrowingPhysics : public world::IPhysicsQuery {
public:
    [[nodiscard]] std::optional<world::RaycastHit> raycast(
        const Vector3& /*origin*/, const Vector3& /*direction*/, float /*maxDistance*/,
        world::TriggerInteraction /*triggers*/) const override {
        throw std::runtime_error("physics scene unavailable");
    }
};

// ---------------------------------------------------------------------------
// FaultyInventory: an inventory whose writes can be lost or throw
// ---------------------------------------------------------------------------

class FaultyInventory : public IInventoryAccess {
public:
    FaultyInventory(std::string typeName, std::string field, int64_t value)
        : typeName_(std::move(typeName)), field_(std::move(field)), value_(value) {}

    bool dropWrites = false;     ///< writeField reports success but stores nothing.
    bool corruptFirstWrite = false;  ///< The first write stores value + 1.
    bool throwOnRead = false;
    bool refuseRestore = false;  ///< After the first write, further writes are refused.
    int writes = 0;

    [[nodiscard]] int64_t stored() const noexcept { return value_; }

    [[nodiscard]] std::string typeName() const override { return typeName_; }
    [[nodiscard]] std::vector<std::string> numericFields() const override { return {field_}; }
    [[nodiscard]] std::optional<int64_t> readField(std::string_view name) const override {
        if (throwOnRead) {
            throw std::runtime_error("field layout changed");
        }
        if (name != field_) {
            return std::nullopt;
        }
        return value_;
    }
    bool writeField(std::string_view name, int64_t value) override {
        if (name != field_) {
            return false;
        }
        ++writes;
        if (refuseRestore && writes > 1) {
            return false;
        }
        if (dropWrites) {
            return true;
        }
        value_ = (corruptFirstWrite && writes == 1) ? value + 1 : value;
        return true;
    }
    [[nodiscard]] std::vector<ItemStack> itemStacks() const override { return {}; }
    bool setStackQuantity(std::size_t /*index*/, int64_t /*quantity*/) override { return false; }

private:
    std::string typeName_;
    std::string field_;
    int64_t value_;
};

// ---------------------------------------------------------------------------
// ScriptedSceneLoader: records every call, loads complete on command
// ---------------------------------------------------------------------------

class ScriptedSceneLoader : public travel::ISceneLoader {
public:
    std::vector<std::string> requested;
    mutable std::size_t calls = 0;
    bool refuseBegin = false;

    [[nodiscard]] foundation::TravelResult<travel::LoadHandle> beginLoad(
        std::string_view sceneId) override {
        ++calls;
        if (refuseBegin) {
            return foundation::TravelResult<travel::LoadHandle>::err(foundation::TravelError(
                foundation::ErrorCode::SceneNotFound, "scripted refusal"));
        }
        requested.emplace_back(sceneId);
        travel::LoadHandle handle(static_cast<uint32_t>(requested.size()));
        state_[handle] = State{};
        return foundation::TravelResult<travel::LoadHandle>::ok(handle);
    }
    [[nodiscard]] float progress(travel::LoadHandle handle) const override {
        ++calls;
        auto it = state_.find(handle);
        if (it == state_.end()) {
            return 0.0f;
        }
        if (it->second.done) {
            return 1.0f;
        }
        return it->second.ready ? 0.9f : 0.1f;
    }
    [[nodiscard]] bool isReadyToActivate(travel::LoadHandle handle) const override {
        ++calls;
        auto it = state_.find(handle);
        return it != state_.end() && it->second.ready && !it->second.activated;
    }
    void activate(travel::LoadHandle handle) override {
        ++calls;
        auto it = state_.find(handle);
        if (it != state_.end()) {
            it->second.activated = true;
        }
    }
    [[nodiscard]] bool isDone(travel::LoadHandle handle) const override {
        ++calls;
        auto it = state_.find(handle);
        return it != state_.end() && it->second.done;
    }
    [[nodiscard]] bool hasFailed(travel::LoadHandle handle) const override {
        ++calls;
        auto it = state_.find(handle);
        return it == state_.end() || it->second.failed;
    }

    /// Mark the latest load ready to activate.
    void makeReady() { latest().ready = true; }
    /// Complete the latest load if it was activated.
    void completeIfActivated() {
        auto& s = latest();
        if (s.activated) {
            s.done = true;
        }
    }
    void failLatest() { latest().failed = true; }
    [[nodiscard]] bool latestActivated() const {
        return state_.at(travel::LoadHandle(static_cast<uint32_t>(requested.size()))).activated;
    }

private:
    struct State {
        bool ready = false;
        bool activated = false;
        bool done = false;
        bool failed = false;
    };

    State& latest() {
        return state_.at(travel::LoadHandle(static_cast<uint32_t>(requested.size())));
    }

    std::unordered_map<travel::LoadHandle, State> state_;
};

} // namespace ftr::test
