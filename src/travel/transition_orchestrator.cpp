#include "ftr/travel/transition_orchestrator.hpp"

#include <exception>
#include <sstream>

#include "ftr/foundation/travel_logger.hpp"

namespace ftr::travel {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::TravelError;
using foundation::TravelResult;

namespace {

std::string formatSeconds(float seconds) {
    std::ostringstream oss;
    oss.precision(3);
    oss << std::fixed << seconds << 's';
    return oss.str();
}

} // namespace

TransitionOrchestrator::TransitionOrchestrator(TravelConfig config, TransitionServices services)
    : config_(std::move(config)),
      services_(services),
      resolver_(services_.world, config_.resolver),
      probe_(services_.physics, config_.placementClearance),
      ledger_(CurrencyLedger::withDefaults(services_.world, config_.currency)) {}

// ---------------------------------------------------------------------------
// Entry points
// ---------------------------------------------------------------------------

TravelResult<void> TransitionOrchestrator::attemptTravel(std::string_view destinationName) {
    if (inProgress_) {
        FTR_LOG_INFO(LogCategory::Travel,
                     "travel to " + std::string(destinationName) + " rejected: already travelling");
        return TravelResult<void>::err(
            TravelError(ErrorCode::TravelInProgress, "a travel attempt is already in progress"));
    }

    auto destination = services_.registry.get(destinationName);
    if (!destination) {
        return TravelResult<void>::err(TravelError(
            ErrorCode::DestinationNotFound, "unknown destination: " + std::string(destinationName)));
    }

    TransitionRequest request;
    request.price = destination->effectivePrice(config_.defaultPrice);
    request.staged = config_.stagedTransition && destination->sceneId.has_value() &&
                     !destination->sceneId->empty();
    request.destination = std::move(*destination);
    return begin(std::move(request));
}

TravelResult<void> TransitionOrchestrator::begin(TransitionRequest request) {
    if (inProgress_) {
        return TravelResult<void>::err(
            TravelError(ErrorCode::TravelInProgress, "a travel attempt is already in progress"));
    }
    if (request.price < 0) {
        return TravelResult<void>::err(
            TravelError(ErrorCode::InvalidArgument, "travel price must not be negative"));
    }

    inProgress_ = true;
    state_ = TransitionState::Charging;
    request_ = std::move(request);
    report_ = TransitionReport{};
    report_.destination = request_.destination.name;
    chargedEntity_.reset();
    handle_ = LoadHandle{};
    activated_ = false;
    stageElapsed_ = 0.0f;
    settleElapsed_ = 0.0f;

    LogContext ctx;
    ctx.destination = request_.destination.name;
    ctx.extra["price"] = std::to_string(request_.price);
    ctx.extra["staged"] = request_.staged ? "true" : "false";
    FTR_LOG_CTX(LogLevel::Info, LogCategory::Travel, "travel requested", ctx);

    UnwindGuard guard(*this);

    try {
        run();
    } catch (const std::exception& e) {
        finish(TransitionOutcome::LoadFailed, std::string("unexpected error: ") + e.what());
    }
    return TravelResult<void>::ok();
}

void TransitionOrchestrator::update(float deltaSeconds) {
    if (!inProgress_) {
        return;
    }
    if (state_ != TransitionState::StagingLoad && state_ != TransitionState::DestinationLoading) {
        return;
    }

    UnwindGuard guard(*this);

    try {
        pollLoad(deltaSeconds);
    } catch (const std::exception& e) {
        finish(TransitionOutcome::LoadFailed, std::string("unexpected error: ") + e.what());
    }
}

bool TransitionOrchestrator::cancel() {
    if (!inProgress_ || state_ == TransitionState::Placing || state_ == TransitionState::Done) {
        return false;
    }
    finish(TransitionOutcome::Cancelled, "cancelled during " + std::string(toString(state_)));
    return true;
}

// ---------------------------------------------------------------------------
// Steps
// ---------------------------------------------------------------------------

void TransitionOrchestrator::run() {
    if (!request_.destination.isActionable()) {
        finish(TransitionOutcome::MissingCoordinates, "destination has no coordinates");
        return;
    }

    charge();
    if (state_ == TransitionState::Done) {
        return;
    }

    const auto& scene = request_.destination.sceneId;
    if (!scene || scene->empty() || *scene == services_.world.activeScene()) {
        state_ = TransitionState::Placing;
        place();
        return;
    }

    if (request_.staged) {
        startLoad(TransitionState::StagingLoad, config_.intermediateScene);
    } else {
        startLoad(TransitionState::DestinationLoading, *scene);
    }
}

void TransitionOrchestrator::charge() {
    std::optional<ResolvedEntity> entity = request_.entity;
    if (!entity) {
        auto resolved = resolver_.resolvePlayer();
        if (!resolved) {
            finish(TransitionOutcome::EntityNotFound, "no player to charge");
            return;
        }
        entity = resolved.value();
    }
    report_.chargeResolver = entity->strategy;

    auto result = ledger_.tryCharge(entity->node, request_.price);
    if (!result) {
        finish(TransitionOutcome::InsufficientFunds, std::string(result.error().message()));
        return;
    }

    const auto& charge = result.value();
    if (charge.status != ChargeStatus::Charged) {
        report_.discrepancy = charge.discrepancy;
        std::string detail = charge.status == ChargeStatus::DetectionFailed
            ? std::string("currency not detected")
            : "not enough currency: have " + std::to_string(charge.available) + ", need " +
                  std::to_string(request_.price);
        finish(TransitionOutcome::InsufficientFunds, std::move(detail));
        return;
    }

    // A free trip charged nothing, so there is nothing to settle on failure.
    if (request_.price > 0) {
        chargedEntity_ = entity;
    }
    report_.candidate = charge.candidate;
    report_.charged = request_.price;
}

void TransitionOrchestrator::startLoad(TransitionState stage, const std::string& sceneId) {
    state_ = stage;
    activated_ = false;
    stageElapsed_ = 0.0f;
    settleElapsed_ = 0.0f;

    if (services_.overlay != nullptr) {
        services_.overlay->fadeIn(config_.overlayFadeSeconds);
    }

    auto handle = services_.loader.beginLoad(sceneId);
    if (!handle) {
        finish(TransitionOutcome::LoadFailed, std::string(handle.error().message()));
        return;
    }
    handle_ = handle.value();

    LogContext ctx;
    ctx.destination = request_.destination.name;
    ctx.extra["stage"] = std::string(toString(stage));
    ctx.extra["scene"] = sceneId;
    FTR_LOG_CTX(LogLevel::Info, LogCategory::Scene, "scene load started", ctx);
}

void TransitionOrchestrator::pollLoad(float deltaSeconds) {
    auto& loader = services_.loader;

    if (loader.hasFailed(handle_)) {
        finish(TransitionOutcome::LoadFailed,
               "scene load failed during " + std::string(toString(state_)));
        return;
    }

    if (!loader.isDone(handle_)) {
        stageElapsed_ += deltaSeconds;
        if (stageElapsed_ > config_.loadTimeoutSeconds) {
            finish(TransitionOutcome::LoadFailed,
                   std::string(toString(state_)) + " timed out after " +
                       formatSeconds(stageElapsed_));
            return;
        }
        if (!activated_ && loader.isReadyToActivate(handle_)) {
            loader.activate(handle_);
            activated_ = true;
        }
        return;
    }

    if (state_ == TransitionState::StagingLoad) {
        recordTiming();
        startLoad(TransitionState::DestinationLoading, *request_.destination.sceneId);
        return;
    }

    // Let the freshly activated scene settle before touching it.
    settleElapsed_ += deltaSeconds;
    if (settleElapsed_ < config_.settleSeconds) {
        return;
    }
    recordTiming();
    state_ = TransitionState::Placing;
    place();
}

void TransitionOrchestrator::place() {
    auto& world = services_.world;

    // Handles from before the load may point into a destroyed graph.
    auto resolved = resolver_.resolvePlayer();
    if (!resolved) {
        finish(TransitionOutcome::EntityNotFound, "player not found after load");
        return;
    }
    report_.placementResolver = resolved.value().strategy;
    const NodeId character = resolver_.resolveActualCharacter(resolved.value().node);

    if (!world.zeroVelocity(character)) {
        FTR_LOG_DEBUG(LogCategory::Travel, "placed entity has no rigidbody");
    }

    const Vector3 target = arrivalTarget();
    const Vector3 arrival = probe_.probe(target).value_or(probe_.ensureClearance(target));
    const Vector3 previous = world.positionOf(character);

    if (!world.setPosition(character, arrival)) {
        finish(TransitionOutcome::EntityNotFound, "player vanished during placement");
        return;
    }

    // A camera outside the moved hierarchy follows by the same offset.
    if (auto camera = world.mainCamera(); camera && world.isAlive(*camera) &&
                                          !world::isInHierarchy(world, *camera, character) &&
                                          !world::isInHierarchy(world, character, *camera)) {
        if (!world.setPosition(*camera, world.positionOf(*camera) + (arrival - previous))) {
            FTR_LOG_DEBUG(LogCategory::Travel, "camera could not follow the player");
        }
    }

    report_.arrival = arrival;
    auto marked = services_.registry.markVisited(request_.destination.name, arrival);
    if (!marked) {
        FTR_LOG_WARN(LogCategory::Registry,
                     "visited state not stored: " + std::string(marked.error().message()));
    }
    finish(TransitionOutcome::Succeeded);
}

Vector3 TransitionOrchestrator::arrivalTarget() const {
    const Vector3 coordinates = *request_.destination.coordinates;
    const auto& anchor = request_.destination.targetNodeName;
    if (!anchor || anchor->empty()) {
        return coordinates;
    }
    try {
        const auto& world = services_.world;
        for (NodeId node : world.allNodes()) {
            if (world.nodeName(node) == *anchor) {
                return world.positionOf(node);
            }
        }
    } catch (const std::exception& e) {
        FTR_LOG_DEBUG(LogCategory::Travel, std::string("anchor lookup failed: ") + e.what());
    }
    FTR_LOG_DEBUG(LogCategory::Travel, "anchor " + *anchor + " not found, using coordinates");
    return coordinates;
}

// ---------------------------------------------------------------------------
// Completion
// ---------------------------------------------------------------------------

void TransitionOrchestrator::recordTiming() {
    report_.timings.push_back(StageTiming{std::string(toString(state_)), stageElapsed_});

    LogContext ctx;
    ctx.destination = request_.destination.name;
    ctx.extra["stage"] = std::string(toString(state_));
    ctx.extra["elapsed"] = formatSeconds(stageElapsed_);
    FTR_LOG_CTX(LogLevel::Info, LogCategory::Scene, "scene stage complete", ctx);
}

void TransitionOrchestrator::settleCharge(TransitionOutcome outcome) {
    report_.discrepancy = true;

    LogContext ctx;
    ctx.destination = request_.destination.name;
    ctx.candidate = report_.candidate;
    ctx.extra["charged"] = std::to_string(report_.charged);
    ctx.extra["outcome"] = std::string(toString(outcome));

    if (config_.refundPolicy != RefundPolicy::RefundOnFailure) {
        FTR_LOG_CTX(LogLevel::Warning, LogCategory::Currency,
                    "charged but did not arrive, no refund", ctx);
        return;
    }

    try {
        NodeId target;
        if (auto resolved = resolver_.resolvePlayer()) {
            target = resolved.value().node;
        } else if (services_.world.isAlive(chargedEntity_->node)) {
            target = chargedEntity_->node;
        } else {
            FTR_LOG_CTX(LogLevel::Error, LogCategory::Currency,
                        "refund impossible, player not found", ctx);
            return;
        }
        auto refunded = ledger_.refund(target, report_.charged, report_.candidate);
        if (!refunded) {
            ctx.extra["error"] = std::string(refunded.error().message());
            FTR_LOG_CTX(LogLevel::Error, LogCategory::Currency, "refund failed", ctx);
            return;
        }
        report_.refunded = true;
        report_.discrepancy = false;
    } catch (const std::exception& e) {
        ctx.extra["error"] = e.what();
        FTR_LOG_CTX(LogLevel::Error, LogCategory::Currency, "refund failed", ctx);
    }
}

void TransitionOrchestrator::finish(TransitionOutcome outcome, std::string detail) {
    // One outcome per attempt.
    if (!inProgress_) {
        return;
    }
    report_.outcome = outcome;
    if (!detail.empty()) {
        report_.detail = std::move(detail);
    }
    if (chargedEntity_ && outcome != TransitionOutcome::Succeeded) {
        settleCharge(outcome);
    }
    if (services_.overlay != nullptr) {
        try {
            services_.overlay->fadeOut(config_.overlayFadeSeconds);
        } catch (const std::exception& e) {
            FTR_LOG_WARN(LogCategory::Travel, std::string("overlay fade-out failed: ") + e.what());
        }
    }

    state_ = TransitionState::Done;
    inProgress_ = false;

    LogContext ctx;
    ctx.destination = report_.destination;
    ctx.extra["outcome"] = std::string(toString(outcome));
    if (!report_.detail.empty()) {
        ctx.extra["detail"] = report_.detail;
    }
    const auto level = report_.discrepancy ? LogLevel::Warning : LogLevel::Info;
    FTR_LOG_CTX(level, LogCategory::Travel, "travel finished", ctx);

    // Slots may start the next attempt, which rewrites report_.
    TransitionReport finished = report_;
    lastReport_ = finished;
    try {
        onFinished_.emit(finished);
    } catch (const std::exception& e) {
        // The attempt is already settled; a failing subscriber cannot change it.
        FTR_LOG_ERROR(LogCategory::Travel,
                      std::string("onFinished subscriber failed: ") + e.what());
    }
}

TransitionOrchestrator::UnwindGuard::~UnwindGuard() {
    if (std::uncaught_exceptions() > exceptions_) {
        self_.abortUnwinding();
    }
}

void TransitionOrchestrator::abortUnwinding() noexcept {
    state_ = TransitionState::Done;
    inProgress_ = false;
    report_.outcome = TransitionOutcome::LoadFailed;
}

}  // namespace ftr::travel
