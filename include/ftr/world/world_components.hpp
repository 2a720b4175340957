#pragma once

/// @file world_components.hpp
/// @brief Plain data components attached to world graph nodes.

#include <cstdint>
#include <string>

#include "ftr/world/math_types.hpp"

namespace ftr::world {

/// Scene name used for nodes that survive scene changes.
inline constexpr const char* kPersistentScene = "DontDestroyOnLoad";

// ── Collider ────────────────────────────────────────────────────────────

/// Box collider. Trigger volumes never stop a ground probe.
struct Collider {
    Aabb bounds;
    bool isTrigger = false;
};

// ── Rigidbody ───────────────────────────────────────────────────────────

struct Rigidbody {
    Vector3 velocity;
    Vector3 angularVelocity;
};

// ── ItemStack ───────────────────────────────────────────────────────────

/// One occupied inventory slot.
struct ItemStack {
    uint32_t itemId = 0;
    std::string itemName;
    int64_t quantity = 0;
};

}  // namespace ftr::world
