#pragma once

/// @file types.hpp
/// @brief Strong ID types shared by the world and travel layers.

#include <cstdint>
#include <functional>

namespace ftr::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct NodeIdTag {};
struct LoadHandleTag {};

/// Handle to a node in the live world graph. Never valid across a scene change
/// unless the node is persistent.
using NodeId = StrongId<NodeIdTag, uint32_t>;

/// Handle to an in-flight asynchronous scene load.
using LoadHandle = StrongId<LoadHandleTag, uint32_t>;

} // namespace ftr::foundation

template <typename Tag, typename T>
struct std::hash<ftr::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const ftr::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
