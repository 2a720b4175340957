#include "ftr/travel/ground_probe.hpp"

#include <exception>
#include <string>

#include "ftr/foundation/travel_logger.hpp"

namespace ftr::travel {

using foundation::LogCategory;

GroundProbe::GroundProbe(const world::IPhysicsQuery& physics, float clearance)
    : physics_(physics), clearance_(clearance) {}

std::optional<Vector3> GroundProbe::probe(const Vector3& point) const {
    const Vector3 origin = point + Vector3::Up() * kCastHeight;
    std::optional<world::RaycastHit> hit;
    try {
        hit = physics_.raycast(origin, Vector3::Down(), kCastDistance,
                               world::TriggerInteraction::Ignore);
    } catch (const std::exception& e) {
        FTR_LOG_DEBUG(LogCategory::Physics, std::string("ground probe failed: ") + e.what());
        return std::nullopt;
    }
    if (!hit) {
        FTR_LOG_DEBUG(LogCategory::Physics, "no ground below target");
        return std::nullopt;
    }
    return Vector3{point.x, hit->point.y + kSurfaceOffset, point.z};
}

Vector3 GroundProbe::groundedPosition(const Vector3& point) const {
    return probe(point).value_or(point);
}

Vector3 GroundProbe::ensureClearance(const Vector3& point) const noexcept {
    return {point.x, point.y + clearance_, point.z};
}

}  // namespace ftr::travel
