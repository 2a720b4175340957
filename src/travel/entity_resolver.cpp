#include "ftr/travel/entity_resolver.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <string>
#include <utility>

#include "ftr/foundation/travel_logger.hpp"
#include "ftr/travel/text_match.hpp"

namespace ftr::travel {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::TravelError;
using foundation::TravelResult;

EntityResolver::EntityResolver(const world::IWorldQuery& world, ResolverOptions options)
    : world_(world), options_(std::move(options)) {}

TravelResult<ResolvedEntity> EntityResolver::resolvePlayer() const {
    using Step = std::optional<NodeId> (EntityResolver::*)() const;
    static constexpr std::array<std::pair<ResolveStrategy, Step>, 5> kChain = {{
        {ResolveStrategy::NamePrefix, &EntityResolver::byNamePrefix},
        {ResolveStrategy::RoleComponent, &EntityResolver::byRoleComponent},
        {ResolveStrategy::Tag, &EntityResolver::byTag},
        {ResolveStrategy::SceneRootScan, &EntityResolver::bySceneRootScan},
        {ResolveStrategy::CameraRoot, &EntityResolver::byCameraRoot},
    }};

    for (const auto& [strategy, step] : kChain) {
        std::optional<NodeId> found;
        try {
            found = (this->*step)();
        } catch (const std::exception& e) {
            FTR_LOG_DEBUG(LogCategory::World,
                          std::string("resolver strategy ") + std::string(toString(strategy)) +
                              " failed: " + e.what());
            continue;
        }
        if (found && found->isValid()) {
            foundation::LogContext ctx;
            ctx.nodeId = *found;
            ctx.extra["strategy"] = std::string(toString(strategy));
            FTR_LOG_CTX(foundation::LogLevel::Debug, LogCategory::World,
                        "player resolved", ctx);
            return TravelResult<ResolvedEntity>::ok(ResolvedEntity{*found, strategy});
        }
    }

    FTR_LOG_WARN(LogCategory::World, "player could not be resolved by any strategy");
    return TravelResult<ResolvedEntity>::err(
        TravelError(ErrorCode::EntityNotFound, "player entity not found"));
}

NodeId EntityResolver::resolveActualCharacter(NodeId root) const {
    try {
        for (NodeId node : world::selfAndDescendants(world_, root)) {
            if (looksLikeCharacter(node)) {
                return node;
            }
        }
    } catch (const std::exception& e) {
        FTR_LOG_DEBUG(LogCategory::World,
                      std::string("character narrowing failed: ") + e.what());
    }
    return root;
}

bool EntityResolver::looksLikeCharacter(NodeId node) const {
    if (startsWithIgnoreCase(world_.nodeName(node), options_.namePrefix)) {
        return true;
    }
    return std::any_of(options_.roleTypes.begin(), options_.roleTypes.end(),
                       [&](const std::string& type) { return world_.hasComponent(node, type); });
}

// ---------------------------------------------------------------------------
// Strategies
// ---------------------------------------------------------------------------

std::optional<NodeId> EntityResolver::byNamePrefix() const {
    for (NodeId node : world_.allNodes()) {
        if (startsWithIgnoreCase(world_.nodeName(node), options_.namePrefix)) {
            return world::rootOf(world_, node);
        }
    }
    return std::nullopt;
}

std::optional<NodeId> EntityResolver::byRoleComponent() const {
    for (const auto& type : options_.roleTypes) {
        auto instances = world_.findByComponent(type);
        if (!instances.empty()) {
            return world::rootOf(world_, instances.front());
        }
    }
    return std::nullopt;
}

std::optional<NodeId> EntityResolver::byTag() const {
    if (options_.playerTag.empty()) {
        return std::nullopt;
    }
    auto tagged = world_.findByTag(options_.playerTag);
    if (!tagged) {
        return std::nullopt;
    }
    return world::rootOf(world_, *tagged);
}

std::optional<NodeId> EntityResolver::bySceneRootScan() const {
    for (NodeId root : world_.activeSceneRoots()) {
        for (NodeId node : world::selfAndDescendants(world_, root)) {
            if (containsIgnoreCase(world_.nodeName(node), options_.nameKeyword)) {
                return root;
            }
        }
    }
    return std::nullopt;
}

std::optional<NodeId> EntityResolver::byCameraRoot() const {
    auto camera = world_.mainCamera();
    if (!camera) {
        return std::nullopt;
    }
    return world::rootOf(world_, *camera);
}

}  // namespace ftr::travel
