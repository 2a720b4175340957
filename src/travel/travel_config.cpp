#include "ftr/travel/travel_config.hpp"

namespace ftr::travel {

using foundation::ErrorCode;
using foundation::TravelError;
using foundation::TravelResult;

TravelResult<TravelConfig> TravelConfig::fromConfig(const foundation::ConfigManager& config) {
    TravelConfig cfg;

    cfg.defaultPrice = config.getOr<int64_t>("travel.default_price", cfg.defaultPrice);
    cfg.currency.currencyItem =
        config.getOr<std::string>("travel.currency_item", cfg.currency.currencyItem);
    cfg.stagedTransition = config.getOr<bool>("travel.staged_transition", cfg.stagedTransition);
    cfg.intermediateScene =
        config.getOr<std::string>("travel.intermediate_scene", cfg.intermediateScene);
    cfg.loadTimeoutSeconds =
        config.getOr<float>("travel.load_timeout_seconds", cfg.loadTimeoutSeconds);
    cfg.settleSeconds = config.getOr<float>("travel.settle_seconds", cfg.settleSeconds);
    cfg.overlayFadeSeconds =
        config.getOr<float>("travel.overlay_fade_seconds", cfg.overlayFadeSeconds);
    cfg.placementClearance =
        config.getOr<float>("travel.placement_clearance", cfg.placementClearance);
    cfg.discoveryRadius = config.getOr<float>("travel.discovery_radius", cfg.discoveryRadius);

    cfg.resolver.namePrefix =
        config.getOr<std::string>("resolver.name_prefix", cfg.resolver.namePrefix);
    cfg.resolver.nameKeyword =
        config.getOr<std::string>("resolver.name_keyword", cfg.resolver.nameKeyword);
    cfg.resolver.playerTag =
        config.getOr<std::string>("resolver.player_tag", cfg.resolver.playerTag);
    cfg.resolver.roleTypes =
        config.getOr<std::vector<std::string>>("resolver.role_types", cfg.resolver.roleTypes);

    cfg.currency.inventoryTypes = config.getOr<std::vector<std::string>>(
        "currency.inventory_types", cfg.currency.inventoryTypes);
    cfg.currency.propertyNames = config.getOr<std::vector<std::string>>(
        "currency.property_names", cfg.currency.propertyNames);
    cfg.currency.scanKeywords = config.getOr<std::vector<std::string>>(
        "currency.scan_keywords", cfg.currency.scanKeywords);

    if (auto policy = config.get<std::string>("travel.refund_policy")) {
        if (policy.value() == toString(RefundPolicy::None)) {
            cfg.refundPolicy = RefundPolicy::None;
        } else if (policy.value() == toString(RefundPolicy::RefundOnFailure)) {
            cfg.refundPolicy = RefundPolicy::RefundOnFailure;
        } else {
            return TravelResult<TravelConfig>::err(
                TravelError(ErrorCode::ConfigTypeMismatch,
                            "unknown travel.refund_policy: " + policy.value()));
        }
    }

    if (cfg.defaultPrice < 0) {
        return TravelResult<TravelConfig>::err(
            TravelError(ErrorCode::InvalidArgument, "travel.default_price must be >= 0"));
    }
    if (cfg.loadTimeoutSeconds <= 0.0f) {
        return TravelResult<TravelConfig>::err(
            TravelError(ErrorCode::InvalidArgument, "travel.load_timeout_seconds must be > 0"));
    }
    if (cfg.settleSeconds < 0.0f || cfg.overlayFadeSeconds < 0.0f ||
        cfg.placementClearance < 0.0f || cfg.discoveryRadius < 0.0f) {
        return TravelResult<TravelConfig>::err(
            TravelError(ErrorCode::InvalidArgument, "travel durations and distances must be >= 0"));
    }
    if (cfg.stagedTransition && cfg.intermediateScene.empty()) {
        return TravelResult<TravelConfig>::err(
            TravelError(ErrorCode::InvalidArgument,
                        "travel.intermediate_scene is required when staged transition is on"));
    }

    return TravelResult<TravelConfig>::ok(std::move(cfg));
}

}  // namespace ftr::travel
