#pragma once

/// @file physics_query.hpp
/// @brief The single physics capability the travel core needs: a ray cast.

#include <cstdint>
#include <optional>

#include "ftr/foundation/types.hpp"
#include "ftr/world/math_types.hpp"

namespace ftr::world {

enum class TriggerInteraction : uint8_t {
    Ignore,  ///< Trigger colliders are transparent to the ray.
    Collide
};

struct RaycastHit {
    foundation::NodeId node;
    float distance = 0.0f;
    Vector3 point;
    Vector3 normal{0.0f, 1.0f, 0.0f};
};

class IPhysicsQuery {
public:
    virtual ~IPhysicsQuery() = default;

    /// Nearest hit along @p direction within @p maxDistance of @p origin.
    /// May throw std::exception if the physics scene is unavailable.
    [[nodiscard]] virtual std::optional<RaycastHit> raycast(
        const Vector3& origin, const Vector3& direction, float maxDistance,
        TriggerInteraction triggers) const = 0;
};

}  // namespace ftr::world
