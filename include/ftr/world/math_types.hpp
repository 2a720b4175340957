#pragma once

/// @file math_types.hpp
/// @brief Lightweight math types for world positions and collider bounds.

#include <cmath>
#include <cstdint>

namespace ftr::world {

/// Three-component floating-point vector.
struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float x, float y, float z) : x(x), y(y), z(z) {}

    constexpr Vector3 operator+(const Vector3& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }
    constexpr Vector3 operator-(const Vector3& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y, z - rhs.z};
    }
    constexpr Vector3 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vector3& operator+=(const Vector3& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    [[nodiscard]] constexpr float Dot(const Vector3& rhs) const noexcept {
        return x * rhs.x + y * rhs.y + z * rhs.z;
    }

    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// Normalized copy, or the zero vector if length is near zero.
    [[nodiscard]] Vector3 Normalized() const noexcept {
        const float len = Length();
        if (len < 1e-6f) {
            return {};
        }
        return {x / len, y / len, z / len};
    }

    [[nodiscard]] static constexpr Vector3 Zero() noexcept { return {}; }
    [[nodiscard]] static constexpr Vector3 Up() noexcept { return {0.0f, 1.0f, 0.0f}; }
    [[nodiscard]] static constexpr Vector3 Down() noexcept { return {0.0f, -1.0f, 0.0f}; }

    constexpr bool operator==(const Vector3&) const = default;
};

constexpr Vector3 operator*(float scalar, const Vector3& v) noexcept {
    return v * scalar;
}

/// Euclidean distance between two points.
inline float Distance(const Vector3& a, const Vector3& b) noexcept {
    return (a - b).Length();
}

/// Axis-aligned box stored as center and half extents.
struct Aabb {
    Vector3 center;
    Vector3 halfExtents{0.5f, 0.5f, 0.5f};

    [[nodiscard]] constexpr Vector3 Min() const noexcept { return center - halfExtents; }
    [[nodiscard]] constexpr Vector3 Max() const noexcept { return center + halfExtents; }
};

}  // namespace ftr::world
