// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dash/core/color.hpp>
#include <dash/core/geometry.hpp>
#include <dash/core/spinner_state.hpp>
#include <dash/core/spinner_style.hpp>
#include <dash/core/text_fit.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dash::core {

struct CircleShape {
    PointF center;
    float radius{0.0f};
    Argb color{0};
    bool filled{true};
    float stroke_width{0.0f};  // outline width when not filled
};

struct LineShape {
    PointF from;
    PointF to;
};

// Angles in degrees, clockwise from 3 o'clock as seen on screen
struct ArcShape {
    PointF center;
    float radius{0.0f};
    float start_angle{0.0f};
    float sweep_angle{0.0f};
    Argb color{0};
    float stroke_width{0.0f};
};

struct TextShape {
    std::string text;
    float size{0.0f};  // px
    Argb color{0};
    PointF center;
};

// Everything one paint pass draws, back to front
struct FrameState {
    CircleShape ring;
    CircleShape inner_circle;
    std::optional<TextShape> text;
    std::vector<LineShape> lines;  // transition line or status symbol
    std::vector<CircleShape> dots; // collapsed text or exclamation dot
    Argb line_color{0};
    float line_stroke{0.0f};
    std::optional<ArcShape> arc;
};

// Alpha of the growing inner circle, round(255 * progress) clamped to [0, 255]
[[nodiscard]] int inner_circle_alpha(float progress) noexcept;

// Radius of the growing inner circle, capped at the full inner radius
[[nodiscard]] float progress_radius(const Geometry& geometry, float progress) noexcept;

// "42%"
[[nodiscard]] std::string progress_text(float progress);

// `end = start + length * (cos a, sin a)`, a in degrees
[[nodiscard]] PointF polar(PointF start, float length, float degrees) noexcept;

// Pure: reads the state, never changes it. `measure` may be empty, in which
// case no text is laid out.
[[nodiscard]] FrameState build_frame(const SpinnerState& state,
                                     const Geometry& geometry,
                                     const SpinnerStyle& style,
                                     const TextMeasure& measure);

} // namespace dash::core
