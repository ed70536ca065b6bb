// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dash/core/dash_mode.hpp>
#include <dash/core/transition.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

namespace dash::core {

// Which scripted step of a terminal transition is in flight
enum class Stage : std::uint8_t {
    idle,
    text_and_circle,  // ramp A, 1 -> 0
    line,             // ramp B, 0 -> 1
    state,            // ramp C, 0 -> 1
    settling          // delay before the completion notification
};

using CompletionCallback = std::function<void(DashMode)>;

// Mode bookkeeping and transition choreography of the spinner.
// Time only moves when advance() is called, so the owner decides the tick rate.
class SpinnerState {
public:
    explicit SpinnerState(float arc_start_position = 270.0f) noexcept;

    // Accepted only in none/download. Returns true if the value was taken.
    bool set_progress(float progress) noexcept;

    // Starts the three-stage transition toward a terminal mode. Any transition or
    // pending notification already in flight is restarted.
    void show(DashMode terminal) noexcept;
    void show_success() noexcept { show(DashMode::success); }
    void show_failure() noexcept { show(DashMode::failure); }
    void show_unknown() noexcept { show(DashMode::unknown); }

    void reset() noexcept;

    // Feeds elapsed time to the active stage. Returns true when the visible
    // state changed and a repaint is needed.
    bool advance(std::chrono::milliseconds elapsed);

    // Moves the indeterminate arc by one frame. Only has an effect in download mode.
    float advance_arc(float sweep_speed) noexcept;

    void on_complete(CompletionCallback callback) { on_complete_ = std::move(callback); }

    [[nodiscard]] DashMode mode() const noexcept { return mode_; }
    [[nodiscard]] DashMode next_mode() const noexcept { return next_mode_; }
    [[nodiscard]] Stage stage() const noexcept { return stage_; }
    [[nodiscard]] float progress() const noexcept { return progress_; }
    [[nodiscard]] float transition_progress() const noexcept { return transition_progress_; }
    [[nodiscard]] float arc_position() const noexcept { return arc_position_; }
    [[nodiscard]] std::uint64_t cycle() const noexcept { return cycle_; }
    [[nodiscard]] bool animating() const noexcept { return stage_ != Stage::idle; }

private:
    void enter_stage(Stage stage) noexcept;
    void finish_cycle();

    DashMode mode_{DashMode::none};
    DashMode next_mode_{DashMode::none};
    Stage stage_{Stage::idle};

    float progress_{0.0f};
    float transition_progress_{0.0f};
    float arc_start_position_;
    float arc_position_;

    RampAnimator text_and_circle_{TRANSITION_START_VALUE, TRANSITION_END_VALUE};
    RampAnimator line_{TRANSITION_END_VALUE, TRANSITION_START_VALUE};
    RampAnimator state_{TRANSITION_END_VALUE, TRANSITION_START_VALUE};
    std::chrono::milliseconds settle_elapsed_{0};

    std::uint64_t cycle_{0};
    CompletionCallback on_complete_;
};

} // namespace dash::core
