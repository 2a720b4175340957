#pragma once

/// @file transition_orchestrator.hpp
/// @brief Cooperative state machine driving one travel attempt end to end.
///
/// A request is charged first, then the scenes load (optionally staged
/// through a low-memory intermediate scene), then the freshly re-resolved
/// player is placed on grounded coordinates. The host drives the machine by
/// calling update(dt) once per frame; scene-load polls are the only points
/// where an attempt yields.
///
/// @code
///   TransitionOrchestrator travel(config, {world, world, loader, registry, &overlay});
///   travel.onFinished().connect([](const TransitionReport& r) { ... });
///   if (auto accepted = travel.attemptTravel("Cierzo"); !accepted) { ... }
///   while (travel.isBusy()) {
///       loader.update(dt);
///       travel.update(dt);
///   }
/// @endcode

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ftr/foundation/signal.hpp"
#include "ftr/foundation/travel_result.hpp"
#include "ftr/travel/currency_ledger.hpp"
#include "ftr/travel/destination.hpp"
#include "ftr/travel/entity_resolver.hpp"
#include "ftr/travel/ground_probe.hpp"
#include "ftr/travel/scene_loader.hpp"
#include "ftr/travel/screen_overlay.hpp"
#include "ftr/travel/travel_config.hpp"

namespace ftr::travel {

enum class TransitionState : uint8_t {
    Idle,
    Charging,
    StagingLoad,
    DestinationLoading,
    Placing,
    Done
};

enum class TransitionOutcome : uint8_t {
    Succeeded,
    InsufficientFunds,
    MissingCoordinates,
    EntityNotFound,
    LoadFailed,
    Cancelled
};

constexpr std::string_view toString(TransitionState state) {
    switch (state) {
        case TransitionState::Idle:               return "Idle";
        case TransitionState::Charging:           return "Charging";
        case TransitionState::StagingLoad:        return "StagingLoad";
        case TransitionState::DestinationLoading: return "DestinationLoading";
        case TransitionState::Placing:            return "Placing";
        case TransitionState::Done:               return "Done";
    }
    return "Unknown";
}

constexpr std::string_view toString(TransitionOutcome outcome) {
    switch (outcome) {
        case TransitionOutcome::Succeeded:          return "Succeeded";
        case TransitionOutcome::InsufficientFunds:  return "InsufficientFunds";
        case TransitionOutcome::MissingCoordinates: return "MissingCoordinates";
        case TransitionOutcome::EntityNotFound:     return "EntityNotFound";
        case TransitionOutcome::LoadFailed:         return "LoadFailed";
        case TransitionOutcome::Cancelled:          return "Cancelled";
    }
    return "Unknown";
}

/// One travel attempt. Consumed by begin().
struct TransitionRequest {
    Destination destination;
    std::optional<ResolvedEntity> entity;  ///< Charged entity; resolved if absent.
    int64_t price = 0;
    bool staged = false;
};

struct StageTiming {
    std::string stage;
    float seconds = 0.0f;
};

/// Outcome of one attempt plus diagnostics for operators.
struct TransitionReport {
    std::string destination;
    TransitionOutcome outcome = TransitionOutcome::LoadFailed;
    std::optional<ResolveStrategy> chargeResolver;
    std::optional<ResolveStrategy> placementResolver;
    std::string candidate;
    int64_t charged = 0;
    bool discrepancy = false;  ///< Charged but did not arrive.
    bool refunded = false;
    std::optional<Vector3> arrival;
    std::vector<StageTiming> timings;
    std::string detail;
};

/// External collaborators. All must outlive the orchestrator.
struct TransitionServices {
    world::IWorldQuery& world;
    world::IPhysicsQuery& physics;
    ISceneLoader& loader;
    IDestinationRegistry& registry;
    IScreenOverlay* overlay = nullptr;
};

class TransitionOrchestrator {
public:
    TransitionOrchestrator(TravelConfig config, TransitionServices services);

    TransitionOrchestrator(const TransitionOrchestrator&) = delete;
    TransitionOrchestrator& operator=(const TransitionOrchestrator&) = delete;

    /// Start travel to a registered destination.
    ///
    /// Accepted attempts always end in exactly one onFinished() emission;
    /// outcomes decided synchronously (missing coordinates, refused charge,
    /// same-scene placement) are emitted before this returns.
    /// @return TravelInProgress if an attempt is active (nothing is touched),
    ///         DestinationNotFound for an unknown name.
    foundation::TravelResult<void> attemptTravel(std::string_view destinationName);

    /// Start an attempt from an explicit request.
    foundation::TravelResult<void> begin(TransitionRequest request);

    /// Advance load polling by one frame.
    void update(float deltaSeconds);

    /// Cancel the active attempt. Only honored before placement starts.
    bool cancel();

    [[nodiscard]] TransitionState state() const noexcept { return state_; }
    [[nodiscard]] bool isBusy() const noexcept { return inProgress_; }
    [[nodiscard]] const std::optional<TransitionReport>& lastReport() const noexcept {
        return lastReport_;
    }

    foundation::Signal<const TransitionReport&>& onFinished() noexcept { return onFinished_; }

    [[nodiscard]] const TravelConfig& config() const noexcept { return config_; }
    [[nodiscard]] const EntityResolver& resolver() const noexcept { return resolver_; }
    [[nodiscard]] CurrencyLedger& ledger() noexcept { return ledger_; }

private:
    /// Clears the in-progress flag when a non-std exception unwinds through
    /// an entry point.
    class UnwindGuard {
    public:
        explicit UnwindGuard(TransitionOrchestrator& self)
            : self_(self), exceptions_(std::uncaught_exceptions()) {}
        ~UnwindGuard();

        UnwindGuard(const UnwindGuard&) = delete;
        UnwindGuard& operator=(const UnwindGuard&) = delete;

    private:
        TransitionOrchestrator& self_;
        int exceptions_;
    };

    void run();
    void charge();
    void startLoad(TransitionState stage, const std::string& sceneId);
    void pollLoad(float deltaSeconds);
    void place();
    void finish(TransitionOutcome outcome, std::string detail = {});
    void settleCharge(TransitionOutcome outcome);
    void recordTiming();
    void abortUnwinding() noexcept;

    [[nodiscard]] Vector3 arrivalTarget() const;

    TravelConfig config_;
    TransitionServices services_;
    EntityResolver resolver_;
    GroundProbe probe_;
    CurrencyLedger ledger_;

    // Per-attempt state, reset by begin().
    TransitionState state_ = TransitionState::Idle;
    bool inProgress_ = false;
    TransitionRequest request_;
    TransitionReport report_;
    std::optional<ResolvedEntity> chargedEntity_;
    LoadHandle handle_;
    bool activated_ = false;
    float stageElapsed_ = 0.0f;
    float settleElapsed_ = 0.0f;

    std::optional<TransitionReport> lastReport_;
    foundation::Signal<const TransitionReport&> onFinished_;
};

}  // namespace ftr::travel
