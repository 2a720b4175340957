#include "ftr/travel/timed_scene_loader.hpp"

#include <algorithm>

#include "ftr/foundation/travel_logger.hpp"

namespace ftr::travel {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::TravelError;
using foundation::TravelResult;

namespace {

constexpr float kReadyProgress = 0.9f;

} // namespace

TimedSceneLoader::TimedSceneLoader(world::SceneGraph& graph) : graph_(graph) {}

void TimedSceneLoader::registerScene(std::string sceneId, float loadSeconds,
                                     SceneBuilder builder) {
    SceneEntry entry;
    entry.loadSeconds = std::max(loadSeconds, 0.0f);
    entry.builder = std::move(builder);
    scenes_[std::move(sceneId)] = std::move(entry);
}

void TimedSceneLoader::setSceneFails(std::string_view sceneId, bool fails) {
    auto it = scenes_.find(std::string(sceneId));
    if (it != scenes_.end()) {
        it->second.fails = fails;
    }
}

TravelResult<LoadHandle> TimedSceneLoader::beginLoad(std::string_view sceneId) {
    auto it = scenes_.find(std::string(sceneId));
    if (it == scenes_.end()) {
        return TravelResult<LoadHandle>::err(
            TravelError(ErrorCode::SceneNotFound, "unknown scene: " + std::string(sceneId)));
    }
    // Earlier loads are superseded unless they are mid-activation.
    for (auto entry = loads_.begin(); entry != loads_.end();) {
        if (entry->second.phase == Phase::Activating) {
            ++entry;
        } else {
            entry = loads_.erase(entry);
        }
    }

    LoadHandle handle(nextHandle_++);
    PendingLoad load;
    load.sceneId = std::string(sceneId);
    load.phase = it->second.fails ? Phase::Failed : Phase::Loading;
    loads_.emplace(handle, std::move(load));
    ++loadsStarted_;
    FTR_LOG_DEBUG(LogCategory::Scene, "load started: " + std::string(sceneId));
    return TravelResult<LoadHandle>::ok(handle);
}

void TimedSceneLoader::update(float deltaSeconds) {
    for (auto& [handle, load] : loads_) {
        switch (load.phase) {
            case Phase::Loading: {
                load.elapsed += deltaSeconds;
                if (load.elapsed >= scenes_.at(load.sceneId).loadSeconds) {
                    load.phase = Phase::Ready;
                }
                break;
            }
            case Phase::Activating:
                completeActivation(load);
                break;
            case Phase::Ready:
            case Phase::Done:
            case Phase::Failed:
                break;
        }
    }
}

void TimedSceneLoader::completeActivation(PendingLoad& load) {
    const std::string previous = graph_.activeScene();
    if (previous != load.sceneId) {
        graph_.unloadScene(previous);
    }
    graph_.setActiveScene(load.sceneId);
    const auto& entry = scenes_.at(load.sceneId);
    if (entry.builder) {
        entry.builder(graph_);
    }
    load.phase = Phase::Done;
    FTR_LOG_DEBUG(LogCategory::Scene, "scene activated: " + load.sceneId);
}

float TimedSceneLoader::progress(LoadHandle handle) const {
    auto it = loads_.find(handle);
    if (it == loads_.end()) {
        return 0.0f;
    }
    const auto& load = it->second;
    switch (load.phase) {
        case Phase::Loading: {
            const float total = scenes_.at(load.sceneId).loadSeconds;
            if (total <= 0.0f) {
                return kReadyProgress;
            }
            return std::min(load.elapsed / total, 1.0f) * kReadyProgress;
        }
        case Phase::Ready:
        case Phase::Activating:
            return kReadyProgress;
        case Phase::Done:
            return 1.0f;
        case Phase::Failed:
            return 0.0f;
    }
    return 0.0f;
}

bool TimedSceneLoader::isReadyToActivate(LoadHandle handle) const {
    auto it = loads_.find(handle);
    return it != loads_.end() && it->second.phase == Phase::Ready;
}

void TimedSceneLoader::activate(LoadHandle handle) {
    auto it = loads_.find(handle);
    if (it != loads_.end() && it->second.phase == Phase::Ready) {
        it->second.phase = Phase::Activating;
    }
}

bool TimedSceneLoader::isDone(LoadHandle handle) const {
    auto it = loads_.find(handle);
    return it != loads_.end() && it->second.phase == Phase::Done;
}

bool TimedSceneLoader::hasFailed(LoadHandle handle) const {
    auto it = loads_.find(handle);
    return it == loads_.end() || it->second.phase == Phase::Failed;
}

}  // namespace ftr::travel
