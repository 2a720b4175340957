#pragma once

/// @file currency_candidate.hpp
/// @brief Candidate storage locations for the travel currency.
///
/// Each candidate knows one plausible shape in which the player's currency
/// can be stored and reads or writes the quantity through the reflection-style
/// inventory interface. A candidate that cannot see its shape reports nullopt
/// from tryRead(); the ledger treats that as "absent".

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ftr/world/inventory_access.hpp"

namespace ftr::travel {

/// Inventories owned by the resolved player, in hierarchy order.
using InventoryList = std::vector<world::IInventoryAccess*>;

class ICurrencyCandidate {
public:
    virtual ~ICurrencyCandidate() = default;

    /// Stable identifier used in logs, reports and refunds.
    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Current quantity, or nullopt when this shape is absent.
    [[nodiscard]] virtual std::optional<int64_t> tryRead(const InventoryList& inventories) const = 0;

    /// Store @p value as the new quantity. False when the write was refused.
    virtual bool tryWrite(const InventoryList& inventories, int64_t value) = 0;
};

// ── NamedPropertyCandidate ──────────────────────────────────────────────

/// A well-known numeric property ("Silver", "Money", ...) on an inventory
/// component of a well-known type. The first type/property pair present wins.
class NamedPropertyCandidate : public ICurrencyCandidate {
public:
    NamedPropertyCandidate(std::vector<std::string> inventoryTypes,
                           std::vector<std::string> propertyNames);

    [[nodiscard]] std::string_view name() const override { return "named-property"; }
    [[nodiscard]] std::optional<int64_t> tryRead(const InventoryList& inventories) const override;
    bool tryWrite(const InventoryList& inventories, int64_t value) override;

private:
    struct Location {
        world::IInventoryAccess* inventory = nullptr;
        std::string field;
    };
    [[nodiscard]] std::optional<Location> locate(const InventoryList& inventories) const;

    std::vector<std::string> inventoryTypes_;
    std::vector<std::string> propertyNames_;
};

// ── ItemStackCandidate ──────────────────────────────────────────────────

/// Item stacks whose item name equals the currency identifier. The quantity
/// is the sum over every matching stack; a decrease drains stacks in order,
/// an increase tops up the first matching stack.
class ItemStackCandidate : public ICurrencyCandidate {
public:
    explicit ItemStackCandidate(std::string currencyItem);

    [[nodiscard]] std::string_view name() const override { return "item-stack"; }
    [[nodiscard]] std::optional<int64_t> tryRead(const InventoryList& inventories) const override;
    bool tryWrite(const InventoryList& inventories, int64_t value) override;

private:
    std::string currencyItem_;
};

// ── NumericFieldScanCandidate ───────────────────────────────────────────

/// Last resort: the first numeric field on any inventory whose name contains
/// the currency identifier or one of the scan keywords.
class NumericFieldScanCandidate : public ICurrencyCandidate {
public:
    NumericFieldScanCandidate(std::string currencyItem, std::vector<std::string> keywords);

    [[nodiscard]] std::string_view name() const override { return "field-scan"; }
    [[nodiscard]] std::optional<int64_t> tryRead(const InventoryList& inventories) const override;
    bool tryWrite(const InventoryList& inventories, int64_t value) override;

private:
    struct Location {
        world::IInventoryAccess* inventory = nullptr;
        std::string field;
    };
    [[nodiscard]] std::optional<Location> locate(const InventoryList& inventories) const;

    std::vector<std::string> keywords_;
};

}  // namespace ftr::travel
