// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dash/core/spinner_state.hpp>
#include <dash/core/config.hpp>
#include <algorithm>
#include <cmath>

namespace dash::core {

namespace {

float wrap_angle(float degrees) noexcept {
    if (!std::isfinite(degrees)) return 0.0f;
    float wrapped = std::fmod(degrees, CIRCULAR_FACTOR);
    if (wrapped < 0.0f) wrapped += CIRCULAR_FACTOR;
    // fmod of a value just below zero can round back up to 360
    return wrapped >= CIRCULAR_FACTOR ? 0.0f : wrapped;
}

} // namespace

SpinnerState::SpinnerState(float arc_start_position) noexcept
    : arc_start_position_(wrap_angle(arc_start_position))
    , arc_position_(arc_start_position_) {
}

bool SpinnerState::set_progress(float progress) noexcept {
    if (mode_ != DashMode::none && mode_ != DashMode::download) {
        return false;
    }

    mode_ = DashMode::download;
    progress_ = std::isnan(progress) ? 0.0f : std::clamp(progress, 0.0f, 1.0f);
    return true;
}

void SpinnerState::show(DashMode terminal) noexcept {
    if (!is_terminal(terminal)) return;

    ++cycle_;
    mode_ = DashMode::transition_text_and_circle;
    next_mode_ = terminal;

    line_.cancel();
    state_.cancel();
    enter_stage(Stage::text_and_circle);
}

void SpinnerState::reset() noexcept {
    ++cycle_;
    text_and_circle_.cancel();
    line_.cancel();
    state_.cancel();
    settle_elapsed_ = std::chrono::milliseconds{0};

    stage_ = Stage::idle;
    mode_ = DashMode::none;
    next_mode_ = DashMode::none;
    progress_ = 0.0f;
    transition_progress_ = 0.0f;
    arc_position_ = arc_start_position_;
}

void SpinnerState::enter_stage(Stage stage) noexcept {
    stage_ = stage;
    switch (stage) {
        case Stage::text_and_circle:
            text_and_circle_.start();
            transition_progress_ = text_and_circle_.value();
            break;
        case Stage::line:
            mode_ = DashMode::transition_line;
            line_.start();
            transition_progress_ = line_.value();
            break;
        case Stage::state:
            mode_ = next_mode_;
            next_mode_ = DashMode::none;
            state_.start();
            transition_progress_ = state_.value();
            break;
        case Stage::settling:
            settle_elapsed_ = std::chrono::milliseconds{0};
            break;
        case Stage::idle:
            break;
    }
}

bool SpinnerState::advance(std::chrono::milliseconds elapsed) {
    RampAnimator* ramp = nullptr;
    Stage next = Stage::idle;

    switch (stage_) {
        case Stage::idle:
            return false;
        case Stage::settling:
            settle_elapsed_ += elapsed;
            if (settle_elapsed_ >= SETTLE_DELAY) {
                finish_cycle();
            }
            return false;
        case Stage::text_and_circle:
            ramp = &text_and_circle_;
            next = Stage::line;
            break;
        case Stage::line:
            ramp = &line_;
            next = Stage::state;
            break;
        case Stage::state:
            ramp = &state_;
            next = Stage::settling;
            break;
    }

    const bool finished = ramp->advance(elapsed);
    transition_progress_ = ramp->value();
    if (finished) {
        // Leftover time is dropped; the next stage begins at its own start value.
        enter_stage(next);
    }
    return true;
}

void SpinnerState::finish_cycle() {
    stage_ = Stage::idle;
    if (on_complete_) {
        on_complete_(mode_);
    }
}

float SpinnerState::advance_arc(float sweep_speed) noexcept {
    if (mode_ != DashMode::download) return arc_position_;

    arc_position_ = wrap_angle(arc_position_ + (1.0f - progress_) * sweep_speed);
    return arc_position_;
}

} // namespace dash::core
