#pragma once

/// @file timed_scene_loader.hpp
/// @brief ISceneLoader that simulates asynchronous loads over a SceneGraph.

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "ftr/travel/scene_loader.hpp"
#include "ftr/world/scene_graph.hpp"

namespace ftr::travel {

/// Populates a freshly activated scene.
using SceneBuilder = std::function<void(world::SceneGraph&)>;

/// Loads registered scenes over a fixed simulated duration.
///
/// update(dt) advances every pending load. Progress climbs to 0.9 and holds
/// there until activate(); the next update() unloads the previous active
/// scene (persistent nodes survive), makes the new scene active and runs its
/// builder.
///
/// beginLoad() supersedes every earlier load that is not mid-activation;
/// their handles become unknown and report failed.
class TimedSceneLoader : public ISceneLoader {
public:
    explicit TimedSceneLoader(world::SceneGraph& graph);

    /// Register a loadable scene.
    /// @param loadSeconds Simulated time until ready-to-activate.
    void registerScene(std::string sceneId, float loadSeconds, SceneBuilder builder = {});

    /// Make loads of @p sceneId fail once they start.
    void setSceneFails(std::string_view sceneId, bool fails);

    /// Advance all pending loads by @p deltaSeconds.
    void update(float deltaSeconds);

    [[nodiscard]] foundation::TravelResult<LoadHandle> beginLoad(std::string_view sceneId) override;
    [[nodiscard]] float progress(LoadHandle handle) const override;
    [[nodiscard]] bool isReadyToActivate(LoadHandle handle) const override;
    void activate(LoadHandle handle) override;
    [[nodiscard]] bool isDone(LoadHandle handle) const override;
    [[nodiscard]] bool hasFailed(LoadHandle handle) const override;

    [[nodiscard]] std::size_t loadsStarted() const noexcept { return loadsStarted_; }

    /// Loads still tracked by handle.
    [[nodiscard]] std::size_t trackedLoads() const noexcept { return loads_.size(); }

private:
    enum class Phase : uint8_t { Loading, Ready, Activating, Done, Failed };

    struct SceneEntry {
        float loadSeconds = 1.0f;
        SceneBuilder builder;
        bool fails = false;
    };

    struct PendingLoad {
        std::string sceneId;
        float elapsed = 0.0f;
        Phase phase = Phase::Loading;
    };

    void completeActivation(PendingLoad& load);

    world::SceneGraph& graph_;
    std::unordered_map<std::string, SceneEntry> scenes_;
    std::unordered_map<LoadHandle, PendingLoad> loads_;
    uint32_t nextHandle_ = 1;
    std::size_t loadsStarted_ = 0;
};

}  // namespace ftr::travel
