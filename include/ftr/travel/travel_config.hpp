#pragma once

/// @file travel_config.hpp
/// @brief Tunables of the travel core and their configuration keys.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "ftr/foundation/config_manager.hpp"
#include "ftr/foundation/travel_result.hpp"

namespace ftr::travel {

/// What to do with a charged amount when travel does not arrive.
enum class RefundPolicy : uint8_t {
    None,            ///< Keep the charge; log the discrepancy.
    RefundOnFailure  ///< Credit the amount back through the charged candidate.
};

constexpr std::string_view toString(RefundPolicy policy) {
    switch (policy) {
        case RefundPolicy::None:            return "none";
        case RefundPolicy::RefundOnFailure: return "refund_on_failure";
    }
    return "unknown";
}

/// Naming conventions used to find the player in the world graph.
struct ResolverOptions {
    std::string namePrefix = "PlayerChar";
    std::string nameKeyword = "Player";
    std::string playerTag = "Player";
    std::vector<std::string> roleTypes = {
        "PlayerCharacter", "PlayerEntity", "LocalPlayer",
        "PlayerController", "Character", "PC_Player"};
};

/// Shapes under which the currency may be stored.
struct CurrencyOptions {
    std::string currencyItem = "Silver";
    std::vector<std::string> inventoryTypes = {
        "CharacterInventory", "Inventory", "PlayerInventory"};
    std::vector<std::string> propertyNames = {
        "Silver", "Money", "Gold", "Coins", "Currency",
        "CurrentMoney", "SilverAmount", "MoneyAmount"};
    std::vector<std::string> scanKeywords = {"money", "gold", "coin", "currency"};
};

struct TravelConfig {
    int64_t defaultPrice = 100;
    bool stagedTransition = true;
    std::string intermediateScene = "LowMemory_TransitionScene";
    float loadTimeoutSeconds = 30.0f;
    float settleSeconds = 0.5f;
    float overlayFadeSeconds = 0.35f;
    float placementClearance = 0.5f;
    float discoveryRadius = 50.0f;
    RefundPolicy refundPolicy = RefundPolicy::None;

    ResolverOptions resolver;
    CurrencyOptions currency;

    /// Read every known key from @p config, keeping defaults for absent keys.
    /// @return InvalidArgument for out-of-range values, ConfigTypeMismatch for
    ///         an unknown refund policy name.
    static foundation::TravelResult<TravelConfig> fromConfig(
        const foundation::ConfigManager& config);
};

}  // namespace ftr::travel
