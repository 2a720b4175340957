#pragma once

/// @file scene_loader.hpp
/// @brief Asynchronous scene load primitive consumed by the orchestrator.

#include <string_view>

#include "ftr/foundation/travel_result.hpp"
#include "ftr/foundation/types.hpp"

namespace ftr::travel {

using foundation::LoadHandle;

/// Engine scene loading, polled once per frame.
///
/// A load runs until it is ready to activate (progress stalls below 1.0),
/// then waits for activate(). Activation swaps the active scene and the load
/// reports isDone(). Unknown handles report not-ready, not-done, failed.
class ISceneLoader {
public:
    virtual ~ISceneLoader() = default;

    [[nodiscard]] virtual foundation::TravelResult<LoadHandle> beginLoad(std::string_view sceneId) = 0;

    /// Load progress in [0, 1].
    [[nodiscard]] virtual float progress(LoadHandle handle) const = 0;

    [[nodiscard]] virtual bool isReadyToActivate(LoadHandle handle) const = 0;

    virtual void activate(LoadHandle handle) = 0;

    /// Activated and fully loaded.
    [[nodiscard]] virtual bool isDone(LoadHandle handle) const = 0;

    [[nodiscard]] virtual bool hasFailed(LoadHandle handle) const = 0;
};

}  // namespace ftr::travel
