#include "ftr/world/inventory_access.hpp"

#include <algorithm>

namespace ftr::world {

ReflectedInventory::ReflectedInventory(std::string typeName)
    : typeName_(std::move(typeName)) {}

ReflectedInventory& ReflectedInventory::withField(std::string name, int64_t value) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const auto& f) { return f.first == name; });
    if (it != fields_.end()) {
        it->second = value;
    } else {
        fields_.emplace_back(std::move(name), value);
    }
    return *this;
}

ReflectedInventory& ReflectedInventory::withStack(uint32_t itemId, std::string itemName,
                                                  int64_t quantity) {
    stacks_.push_back(ItemStack{itemId, std::move(itemName), quantity});
    return *this;
}

std::string ReflectedInventory::typeName() const {
    return typeName_;
}

std::vector<std::string> ReflectedInventory::numericFields() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& [name, value] : fields_) {
        names.push_back(name);
    }
    return names;
}

std::optional<int64_t> ReflectedInventory::readField(std::string_view name) const {
    for (const auto& [fieldName, value] : fields_) {
        if (fieldName == name) {
            return value;
        }
    }
    return std::nullopt;
}

bool ReflectedInventory::writeField(std::string_view name, int64_t value) {
    for (auto& [fieldName, stored] : fields_) {
        if (fieldName == name) {
            stored = value;
            return true;
        }
    }
    return false;
}

std::vector<ItemStack> ReflectedInventory::itemStacks() const {
    return stacks_;
}

bool ReflectedInventory::setStackQuantity(std::size_t index, int64_t quantity) {
    if (index >= stacks_.size() || quantity < 0) {
        return false;
    }
    stacks_[index].quantity = quantity;
    return true;
}

}  // namespace ftr::world
