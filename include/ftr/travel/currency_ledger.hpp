#pragma once

/// @file currency_ledger.hpp
/// @brief Detects and deducts the travel price from the player's inventory.
///
/// The ledger never deducts without confirming and never reports a charge
/// that did not reduce the stored quantity. Candidates are tried in order;
/// each one is read, written, and re-read. A write that cannot be confirmed
/// is rolled back before the next candidate is tried.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ftr/foundation/travel_result.hpp"
#include "ftr/travel/currency_candidate.hpp"
#include "ftr/travel/travel_config.hpp"
#include "ftr/world/world_query.hpp"

namespace ftr::travel {

enum class ChargeStatus : uint8_t {
    Charged,
    InsufficientFunds,  ///< Readable somewhere, never enough.
    DetectionFailed     ///< No candidate could see any currency.
};

constexpr std::string_view toString(ChargeStatus status) {
    switch (status) {
        case ChargeStatus::Charged:           return "charged";
        case ChargeStatus::InsufficientFunds: return "insufficient-funds";
        case ChargeStatus::DetectionFailed:   return "detection-failed";
    }
    return "unknown";
}

struct ChargeResult {
    ChargeStatus status = ChargeStatus::DetectionFailed;
    std::string candidate;     ///< Candidate that was charged.
    int64_t before = 0;
    int64_t after = 0;
    int64_t available = 0;     ///< Largest quantity any candidate reported.
    bool discrepancy = false;  ///< A write could not be confirmed or undone.
};

class CurrencyLedger {
public:
    using CandidateList = std::vector<std::unique_ptr<ICurrencyCandidate>>;

    CurrencyLedger(const world::IWorldQuery& world, CandidateList candidates);

    /// Ledger with the standard candidate order: named property, item stack,
    /// numeric field scan.
    static CurrencyLedger withDefaults(const world::IWorldQuery& world,
                                       const CurrencyOptions& options);

    /// Charge @p amount to @p entity.
    /// @return The charge result, or InvalidArgument for a negative amount.
    [[nodiscard]] foundation::TravelResult<ChargeResult> tryCharge(world::NodeId entity,
                                                                   int64_t amount);

    /// First quantity any candidate can read, without mutating anything.
    [[nodiscard]] std::optional<int64_t> detect(world::NodeId entity) const;

    /// Credit @p amount back through the named candidate, confirmed by re-read.
    foundation::TravelResult<void> refund(world::NodeId entity, int64_t amount,
                                          std::string_view candidateName);

    [[nodiscard]] std::size_t candidateCount() const noexcept { return candidates_.size(); }

private:
    [[nodiscard]] InventoryList inventoriesOf(world::NodeId entity) const;
    [[nodiscard]] std::optional<int64_t> safeRead(const ICurrencyCandidate& candidate,
                                                  const InventoryList& inventories) const;
    bool safeWrite(ICurrencyCandidate& candidate, const InventoryList& inventories,
                   int64_t value);

    /// Restore @p original after an unconfirmed write. True when verified.
    bool rollback(ICurrencyCandidate& candidate, const InventoryList& inventories,
                  int64_t original);

    const world::IWorldQuery& world_;
    CandidateList candidates_;
};

}  // namespace ftr::travel
