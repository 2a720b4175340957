#include "ftr/travel/currency_ledger.hpp"

#include <algorithm>
#include <exception>

#include "ftr/foundation/travel_logger.hpp"

namespace ftr::travel {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::TravelError;
using foundation::TravelResult;

CurrencyLedger::CurrencyLedger(const world::IWorldQuery& world, CandidateList candidates)
    : world_(world), candidates_(std::move(candidates)) {}

CurrencyLedger CurrencyLedger::withDefaults(const world::IWorldQuery& world,
                                            const CurrencyOptions& options) {
    CandidateList candidates;
    candidates.push_back(std::make_unique<NamedPropertyCandidate>(options.inventoryTypes,
                                                                  options.propertyNames));
    candidates.push_back(std::make_unique<ItemStackCandidate>(options.currencyItem));
    candidates.push_back(std::make_unique<NumericFieldScanCandidate>(options.currencyItem,
                                                                     options.scanKeywords));
    return CurrencyLedger(world, std::move(candidates));
}

InventoryList CurrencyLedger::inventoriesOf(world::NodeId entity) const {
    try {
        return world_.inventoriesOf(entity);
    } catch (const std::exception& e) {
        FTR_LOG_WARN(LogCategory::Currency,
                     std::string("inventory lookup failed: ") + e.what());
        return {};
    }
}

std::optional<int64_t> CurrencyLedger::safeRead(const ICurrencyCandidate& candidate,
                                                const InventoryList& inventories) const {
    try {
        return candidate.tryRead(inventories);
    } catch (const std::exception& e) {
        FTR_LOG_DEBUG(LogCategory::Currency, std::string("candidate ") +
                                                 std::string(candidate.name()) +
                                                 " read failed: " + e.what());
        return std::nullopt;
    }
}

bool CurrencyLedger::safeWrite(ICurrencyCandidate& candidate, const InventoryList& inventories,
                               int64_t value) {
    try {
        return candidate.tryWrite(inventories, value);
    } catch (const std::exception& e) {
        FTR_LOG_WARN(LogCategory::Currency, std::string("candidate ") +
                                                std::string(candidate.name()) +
                                                " write failed: " + e.what());
        return false;
    }
}

bool CurrencyLedger::rollback(ICurrencyCandidate& candidate, const InventoryList& inventories,
                              int64_t original) {
    auto current = safeRead(candidate, inventories);
    if (current && *current == original) {
        return true;
    }
    (void)safeWrite(candidate, inventories, original);
    current = safeRead(candidate, inventories);
    return current && *current == original;
}

TravelResult<ChargeResult> CurrencyLedger::tryCharge(world::NodeId entity, int64_t amount) {
    if (amount < 0) {
        return TravelResult<ChargeResult>::err(
            TravelError(ErrorCode::InvalidArgument, "charge amount must not be negative"));
    }

    ChargeResult result;
    if (amount == 0) {
        result.status = ChargeStatus::Charged;
        return TravelResult<ChargeResult>::ok(result);
    }

    const auto inventories = inventoriesOf(entity);
    bool anyReadable = false;

    for (auto& candidate : candidates_) {
        auto before = safeRead(*candidate, inventories);
        if (!before) {
            continue;
        }
        anyReadable = true;
        result.available = std::max(result.available, *before);
        if (*before < amount) {
            continue;
        }

        const int64_t target = *before - amount;
        const bool written = safeWrite(*candidate, inventories, target);
        const auto confirmed = safeRead(*candidate, inventories);

        LogContext ctx;
        ctx.nodeId = entity;
        ctx.candidate = std::string(candidate->name());
        ctx.extra["before"] = std::to_string(*before);
        ctx.extra["amount"] = std::to_string(amount);

        if (written && confirmed && *confirmed == target) {
            result.status = ChargeStatus::Charged;
            result.candidate = std::string(candidate->name());
            result.before = *before;
            result.after = target;
            FTR_LOG_CTX(LogLevel::Info, LogCategory::Currency, "charge confirmed", ctx);
            return TravelResult<ChargeResult>::ok(result);
        }

        ctx.extra["observed"] = confirmed ? std::to_string(*confirmed) : "unreadable";
        FTR_LOG_CTX(LogLevel::Warning, LogCategory::Currency,
                    "charge not confirmed, rolling back", ctx);

        if (!rollback(*candidate, inventories, *before)) {
            // Stored value is unknown now; trying another candidate could
            // charge twice.
            result.discrepancy = true;
            FTR_LOG_CTX(LogLevel::Error, LogCategory::Currency,
                        "rollback failed, currency state is inconsistent", ctx);
            result.status = ChargeStatus::InsufficientFunds;
            return TravelResult<ChargeResult>::ok(result);
        }
    }

    result.status = anyReadable ? ChargeStatus::InsufficientFunds
                                : ChargeStatus::DetectionFailed;
    LogContext ctx;
    ctx.nodeId = entity;
    ctx.extra["amount"] = std::to_string(amount);
    ctx.extra["available"] = std::to_string(result.available);
    FTR_LOG_CTX(LogLevel::Info, LogCategory::Currency,
                std::string("charge refused: ") + std::string(toString(result.status)), ctx);
    return TravelResult<ChargeResult>::ok(result);
}

std::optional<int64_t> CurrencyLedger::detect(world::NodeId entity) const {
    const auto inventories = inventoriesOf(entity);
    for (const auto& candidate : candidates_) {
        if (auto value = safeRead(*candidate, inventories)) {
            return value;
        }
    }
    return std::nullopt;
}

TravelResult<void> CurrencyLedger::refund(world::NodeId entity, int64_t amount,
                                          std::string_view candidateName) {
    if (amount < 0) {
        return TravelResult<void>::err(
            TravelError(ErrorCode::InvalidArgument, "refund amount must not be negative"));
    }
    auto it = std::find_if(candidates_.begin(), candidates_.end(),
                           [&](const auto& c) { return c->name() == candidateName; });
    if (it == candidates_.end()) {
        return TravelResult<void>::err(TravelError(
            ErrorCode::NotFound, "unknown currency candidate: " + std::string(candidateName)));
    }
    if (amount == 0) {
        return TravelResult<void>::ok();
    }

    const auto inventories = inventoriesOf(entity);
    auto before = safeRead(**it, inventories);
    if (!before) {
        return TravelResult<void>::err(
            TravelError(ErrorCode::CurrencyDetectionFailed, "refund target not readable"));
    }
    const int64_t target = *before + amount;
    const bool written = safeWrite(**it, inventories, target);
    auto confirmed = safeRead(**it, inventories);
    if (!written || !confirmed || *confirmed != target) {
        if (!rollback(**it, inventories, *before)) {
            FTR_LOG_ERROR(LogCategory::Currency, "refund rollback failed");
        }
        return TravelResult<void>::err(
            TravelError(ErrorCode::CurrencyWriteFailed, "refund could not be confirmed"));
    }

    LogContext ctx;
    ctx.nodeId = entity;
    ctx.candidate = std::string(candidateName);
    ctx.extra["amount"] = std::to_string(amount);
    FTR_LOG_CTX(LogLevel::Info, LogCategory::Currency, "refund confirmed", ctx);
    return TravelResult<void>::ok();
}

}  // namespace ftr::travel
