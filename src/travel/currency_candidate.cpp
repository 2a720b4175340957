#include "ftr/travel/currency_candidate.hpp"

#include <algorithm>

#include "ftr/travel/text_match.hpp"

namespace ftr::travel {

// ---------------------------------------------------------------------------
// NamedPropertyCandidate
// ---------------------------------------------------------------------------

NamedPropertyCandidate::NamedPropertyCandidate(std::vector<std::string> inventoryTypes,
                                               std::vector<std::string> propertyNames)
    : inventoryTypes_(std::move(inventoryTypes)), propertyNames_(std::move(propertyNames)) {}

std::optional<NamedPropertyCandidate::Location> NamedPropertyCandidate::locate(
    const InventoryList& inventories) const {
    for (const auto& type : inventoryTypes_) {
        for (auto* inventory : inventories) {
            if (inventory == nullptr || inventory->typeName() != type) {
                continue;
            }
            for (const auto& property : propertyNames_) {
                if (inventory->readField(property)) {
                    return Location{inventory, property};
                }
            }
        }
    }
    return std::nullopt;
}

std::optional<int64_t> NamedPropertyCandidate::tryRead(const InventoryList& inventories) const {
    auto loc = locate(inventories);
    if (!loc) {
        return std::nullopt;
    }
    return loc->inventory->readField(loc->field);
}

bool NamedPropertyCandidate::tryWrite(const InventoryList& inventories, int64_t value) {
    auto loc = locate(inventories);
    if (!loc) {
        return false;
    }
    return loc->inventory->writeField(loc->field, value);
}

// ---------------------------------------------------------------------------
// ItemStackCandidate
// ---------------------------------------------------------------------------

ItemStackCandidate::ItemStackCandidate(std::string currencyItem)
    : currencyItem_(std::move(currencyItem)) {}

std::optional<int64_t> ItemStackCandidate::tryRead(const InventoryList& inventories) const {
    bool found = false;
    int64_t total = 0;
    for (auto* inventory : inventories) {
        if (inventory == nullptr) {
            continue;
        }
        for (const auto& stack : inventory->itemStacks()) {
            if (equalsIgnoreCase(stack.itemName, currencyItem_)) {
                found = true;
                total += stack.quantity;
            }
        }
    }
    if (!found) {
        return std::nullopt;
    }
    return total;
}

bool ItemStackCandidate::tryWrite(const InventoryList& inventories, int64_t value) {
    auto current = tryRead(inventories);
    if (!current || value < 0) {
        return false;
    }
    int64_t delta = value - *current;
    if (delta == 0) {
        return true;
    }

    for (auto* inventory : inventories) {
        if (inventory == nullptr) {
            continue;
        }
        auto stacks = inventory->itemStacks();
        for (std::size_t i = 0; i < stacks.size() && delta != 0; ++i) {
            if (!equalsIgnoreCase(stacks[i].itemName, currencyItem_)) {
                continue;
            }
            if (delta > 0) {
                if (!inventory->setStackQuantity(i, stacks[i].quantity + delta)) {
                    return false;
                }
                delta = 0;
            } else {
                const int64_t take = std::min(stacks[i].quantity, -delta);
                if (take == 0) {
                    continue;
                }
                if (!inventory->setStackQuantity(i, stacks[i].quantity - take)) {
                    return false;
                }
                delta += take;
            }
        }
        if (delta == 0) {
            break;
        }
    }
    return delta == 0;
}

// ---------------------------------------------------------------------------
// NumericFieldScanCandidate
// ---------------------------------------------------------------------------

NumericFieldScanCandidate::NumericFieldScanCandidate(std::string currencyItem,
                                                     std::vector<std::string> keywords)
    : keywords_(std::move(keywords)) {
    if (!currencyItem.empty()) {
        keywords_.insert(keywords_.begin(), std::move(currencyItem));
    }
}

std::optional<NumericFieldScanCandidate::Location> NumericFieldScanCandidate::locate(
    const InventoryList& inventories) const {
    for (auto* inventory : inventories) {
        if (inventory == nullptr) {
            continue;
        }
        for (const auto& field : inventory->numericFields()) {
            bool matches = std::any_of(keywords_.begin(), keywords_.end(),
                                       [&](const std::string& kw) {
                                           return containsIgnoreCase(field, kw);
                                       });
            if (matches) {
                return Location{inventory, field};
            }
        }
    }
    return std::nullopt;
}

std::optional<int64_t> NumericFieldScanCandidate::tryRead(const InventoryList& inventories) const {
    auto loc = locate(inventories);
    if (!loc) {
        return std::nullopt;
    }
    return loc->inventory->readField(loc->field);
}

bool NumericFieldScanCandidate::tryWrite(const InventoryList& inventories, int64_t value) {
    auto loc = locate(inventories);
    if (!loc) {
        return false;
    }
    return loc->inventory->writeField(loc->field, value);
}

}  // namespace ftr::travel
