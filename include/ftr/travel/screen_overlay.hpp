#pragma once

/// @file screen_overlay.hpp
/// @brief Full-screen overlay that hides the world while scenes swap.

namespace ftr::travel {

class IScreenOverlay {
public:
    virtual ~IScreenOverlay() = default;

    /// Start fading to opaque over @p seconds.
    virtual void fadeIn(float seconds) = 0;

    /// Start fading to transparent over @p seconds.
    virtual void fadeOut(float seconds) = 0;

    /// Current opacity in [0, 1].
    [[nodiscard]] virtual float alpha() const = 0;
};

}  // namespace ftr::travel
