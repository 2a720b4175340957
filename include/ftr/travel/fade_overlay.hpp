#pragma once

/// @file fade_overlay.hpp
/// @brief Linear alpha tween implementing IScreenOverlay.

#include "ftr/travel/screen_overlay.hpp"

namespace ftr::travel {

/// Alpha tween driven by update(dt). A new fade starts from the current
/// alpha, so reversing mid-fade does not jump.
class FadeOverlay : public IScreenOverlay {
public:
    FadeOverlay() = default;

    void fadeIn(float seconds) override;
    void fadeOut(float seconds) override;
    [[nodiscard]] float alpha() const override { return alpha_; }

    void showInstant();
    void hideInstant();

    /// Advance the active fade.
    void update(float deltaSeconds);

    [[nodiscard]] bool isFading() const noexcept { return alpha_ != target_; }
    [[nodiscard]] bool isOpaque() const noexcept { return alpha_ >= 1.0f; }
    [[nodiscard]] bool isVisible() const noexcept { return alpha_ > 0.0f; }

private:
    void startFade(float target, float seconds);

    float alpha_ = 0.0f;
    float target_ = 0.0f;
    float rate_ = 0.0f;  ///< Alpha units per second.
};

}  // namespace ftr::travel
