#pragma once

/// @file inventory_access.hpp
/// @brief Reflection-style access to an externally owned inventory component.
///
/// The host exposes inventories only through names: a component type name,
/// named numeric fields and a list of item stacks. Any call may fail or throw
/// when the underlying shape changed; callers treat that as "absent".

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ftr/world/world_components.hpp"

namespace ftr::world {

class IInventoryAccess {
public:
    virtual ~IInventoryAccess() = default;

    /// Component type name, e.g. "CharacterInventory".
    [[nodiscard]] virtual std::string typeName() const = 0;

    /// Names of every numeric field or property readable on the component.
    [[nodiscard]] virtual std::vector<std::string> numericFields() const = 0;

    /// Read a numeric field. nullopt when the field does not exist.
    [[nodiscard]] virtual std::optional<int64_t> readField(std::string_view name) const = 0;

    /// Write a numeric field. Returns false when the write was refused.
    virtual bool writeField(std::string_view name, int64_t value) = 0;

    [[nodiscard]] virtual std::vector<ItemStack> itemStacks() const = 0;

    /// Set the quantity of the stack at @p index. A quantity of 0 empties it.
    virtual bool setStackQuantity(std::size_t index, int64_t quantity) = 0;
};

/// In-memory inventory backed by a field table and a stack list.
///
/// Used by the simulated world and as the reference shape in tests.
class ReflectedInventory : public IInventoryAccess {
public:
    explicit ReflectedInventory(std::string typeName);

    /// Declare (or overwrite) a numeric field.
    ReflectedInventory& withField(std::string name, int64_t value);

    /// Append an item stack.
    ReflectedInventory& withStack(uint32_t itemId, std::string itemName, int64_t quantity);

    [[nodiscard]] std::string typeName() const override;
    [[nodiscard]] std::vector<std::string> numericFields() const override;
    [[nodiscard]] std::optional<int64_t> readField(std::string_view name) const override;
    bool writeField(std::string_view name, int64_t value) override;
    [[nodiscard]] std::vector<ItemStack> itemStacks() const override;
    bool setStackQuantity(std::size_t index, int64_t quantity) override;

private:
    std::string typeName_;
    std::vector<std::pair<std::string, int64_t>> fields_;
    std::vector<ItemStack> stacks_;
};

}  // namespace ftr::world
