// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dash/core/config.hpp>
#include <chrono>

namespace dash::core {

// Decelerating curve, 1 - (1 - t)^2. Same shape as QEasingCurve::OutQuad.
[[nodiscard]] float decelerate(float t) noexcept;

// Scalar ramp from one value to another over a fixed duration
class RampAnimator {
public:
    RampAnimator() = default;
    RampAnimator(float from, float to, std::chrono::milliseconds duration = TRANSITION_DURATION) noexcept;

    // Restarts from the beginning, cancelling any run in progress
    void start() noexcept;
    void cancel() noexcept;

    // Moves the ramp forward. Returns true on the step that reaches the end.
    bool advance(std::chrono::milliseconds elapsed) noexcept;

    [[nodiscard]] bool running() const noexcept { return running_; }
    [[nodiscard]] float value() const noexcept;
    [[nodiscard]] float fraction() const noexcept;
    [[nodiscard]] float from() const noexcept { return from_; }
    [[nodiscard]] float to() const noexcept { return to_; }
    [[nodiscard]] std::chrono::milliseconds duration() const noexcept { return duration_; }

private:
    float from_{TRANSITION_END_VALUE};
    float to_{TRANSITION_START_VALUE};
    std::chrono::milliseconds duration_{TRANSITION_DURATION};
    std::chrono::milliseconds elapsed_{0};
    bool running_{false};
};

} // namespace dash::core
