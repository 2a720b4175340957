#pragma once

/// @file ground_probe.hpp
/// @brief Finds standable ground beneath a target point.

#include <optional>

#include "ftr/world/physics_query.hpp"

namespace ftr::travel {

using world::Vector3;

class GroundProbe {
public:
    static constexpr float kCastHeight = 5.0f;
    static constexpr float kCastDistance = 50.0f;
    static constexpr float kSurfaceOffset = 0.1f;

    /// @param clearance Vertical offset applied by ensureClearance().
    explicit GroundProbe(const world::IPhysicsQuery& physics, float clearance = 0.5f);

    /// Cast from kCastHeight above @p point straight down, up to
    /// kCastDistance, ignoring trigger colliders. On a hit, returns @p point
    /// with its height set kSurfaceOffset above the surface. nullopt on a
    /// miss or when the physics query fails.
    [[nodiscard]] std::optional<Vector3> probe(const Vector3& point) const;

    /// probe() result, or @p point unchanged on a miss. A miss gives no
    /// safety guarantee.
    [[nodiscard]] Vector3 groundedPosition(const Vector3& point) const;

    /// @p point raised by the configured clearance, for placements with no
    /// ground data at all.
    [[nodiscard]] Vector3 ensureClearance(const Vector3& point) const noexcept;

private:
    const world::IPhysicsQuery& physics_;
    float clearance_;
};

}  // namespace ftr::travel
