// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dash/core/transition.hpp>
#include <algorithm>

namespace dash::core {

float decelerate(float t) noexcept {
    t = std::clamp(t, 0.0f, 1.0f);
    const float inverse = 1.0f - t;
    return 1.0f - inverse * inverse;
}

RampAnimator::RampAnimator(float from, float to, std::chrono::milliseconds duration) noexcept
    : from_(from)
    , to_(to)
    , duration_(std::max(duration, std::chrono::milliseconds{1})) {
}

void RampAnimator::start() noexcept {
    elapsed_ = std::chrono::milliseconds{0};
    running_ = true;
}

void RampAnimator::cancel() noexcept {
    running_ = false;
}

bool RampAnimator::advance(std::chrono::milliseconds elapsed) noexcept {
    if (!running_) return false;

    elapsed_ += std::max(elapsed, std::chrono::milliseconds{0});
    if (elapsed_ >= duration_) {
        elapsed_ = duration_;
        running_ = false;
        return true;
    }
    return false;
}

float RampAnimator::fraction() const noexcept {
    return static_cast<float>(elapsed_.count()) / static_cast<float>(duration_.count());
}

float RampAnimator::value() const noexcept {
    return from_ + (to_ - from_) * decelerate(fraction());
}

} // namespace dash::core
