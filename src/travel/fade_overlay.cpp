#include "ftr/travel/fade_overlay.hpp"

#include <algorithm>
#include <cmath>

namespace ftr::travel {

void FadeOverlay::startFade(float target, float seconds) {
    target_ = target;
    if (seconds <= 0.0f) {
        alpha_ = target;
        rate_ = 0.0f;
        return;
    }
    rate_ = 1.0f / seconds;
}

void FadeOverlay::fadeIn(float seconds) {
    startFade(1.0f, seconds);
}

void FadeOverlay::fadeOut(float seconds) {
    startFade(0.0f, seconds);
}

void FadeOverlay::showInstant() {
    alpha_ = target_ = 1.0f;
}

void FadeOverlay::hideInstant() {
    alpha_ = target_ = 0.0f;
}

void FadeOverlay::update(float deltaSeconds) {
    if (alpha_ == target_ || deltaSeconds <= 0.0f) {
        return;
    }
    const float step = rate_ * deltaSeconds;
    if (std::abs(target_ - alpha_) <= step) {
        alpha_ = target_;
    } else if (target_ > alpha_) {
        alpha_ += step;
    } else {
        alpha_ -= step;
    }
    alpha_ = std::clamp(alpha_, 0.0f, 1.0f);
}

}  // namespace ftr::travel
