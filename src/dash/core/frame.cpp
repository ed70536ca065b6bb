// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dash/core/frame.hpp>
#include <dash/core/config.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace dash::core {

namespace {

constexpr float DEG_TO_RAD = std::numbers::pi_v<float> / 180.0f;

void add_inner_circle(FrameState& frame, const SpinnerState& state,
                      const Geometry& g, const SpinnerStyle& style) {
    const float full_radius = static_cast<float>(g.inner_circle_radius);
    auto& circle = frame.inner_circle;
    circle.center = g.center();

    switch (state.mode()) {
        case DashMode::none:
            circle.radius = 0.0f;
            circle.color = with_alpha(style.inner_circle_success_color, 0);
            break;

        case DashMode::download:
            circle.radius = progress_radius(g, state.progress());
            circle.color = with_alpha(style.inner_circle_success_color, inner_circle_alpha(state.progress()));
            break;

        case DashMode::transition_text_and_circle:
        case DashMode::transition_line: {
            const DashMode next = state.next_mode();
            if (next != DashMode::failure && next != DashMode::unknown) {
                circle.radius = full_radius;
                circle.color = with_alpha(style.inner_circle_success_color, MAX_ALPHA);
                break;
            }

            const Argb color = style.inner_circle_color(next);
            if (state.mode() == DashMode::transition_line) {
                circle.radius = full_radius;
                circle.color = with_alpha(color, MAX_ALPHA);
                break;
            }

            // Catch up from wherever the download left the circle. Ramp A runs
            // 1 -> 0, so the inverse is the share of the remaining gap to close.
            const float inverse = 1.0f - state.transition_progress();
            const float start_radius = progress_radius(g, state.progress());
            const int start_alpha = inner_circle_alpha(state.progress());

            circle.radius = start_radius + (full_radius - start_radius) * inverse;
            circle.color = with_alpha(color, start_alpha + static_cast<int>((MAX_ALPHA - start_alpha) * inverse));
            break;
        }

        case DashMode::success:
        case DashMode::failure:
        case DashMode::unknown:
            circle.radius = full_radius;
            circle.color = with_alpha(style.inner_circle_color(state.mode()), MAX_ALPHA);
            break;
    }
}

void add_progress_content(FrameState& frame, const SpinnerState& state, const Geometry& g,
                          const SpinnerStyle& style, const TextMeasure& measure) {
    const bool collapsing = state.mode() == DashMode::transition_text_and_circle;

    if (collapsing && state.transition_progress() < TRANSITION_START_VALUE * TEXT_SCALE_DOWN_PERCENT) {
        frame.dots.push_back({g.center(), STATE_LINE_STROKE / 2.0f, style.text_color_to});
        return;
    }

    if (!style.show_progress_text || !measure) return;

    const float radius = progress_radius(g, state.progress());
    const float target_width = (collapsing ? radius * state.transition_progress() * 2.0f : radius * 2.0f)
                             - TEXT_PADDING;

    TextShape text;
    text.text = progress_text(state.progress());
    text.size = fit_text_size(text.text, target_width, 0.0f, style.max_text_size, TEXT_SIZE_PRECISION, measure);
    text.color = collapsing ? style.text_color_to
                            : blend_colors(style.text_color_from, style.text_color_to, state.progress());
    text.center = g.center();

    if (text.size >= MIN_DRAWABLE_TEXT_SIZE) {
        frame.text = std::move(text);
    }
}

void add_transition_line(FrameState& frame, const SpinnerState& state, const Geometry& g) {
    const float c = static_cast<float>(g.view_center);
    const float length = g.line_width * state.transition_progress();

    if (state.next_mode() == DashMode::success) {
        // Offset so the tick joint ends up at the center
        frame.lines.push_back({{c - TICK_SHORT_ARM_RATIO * length, c}, {c + TICK_LONG_ARM_RATIO * length, c}});
    } else {
        frame.lines.push_back({{c - length / 2.0f, c}, {c + length / 2.0f, c}});
    }
}

//   /
// \/  <- joint sits below the center by the short arm's drop
void add_tick(FrameState& frame, const SpinnerState& state, const Geometry& g) {
    const float c = static_cast<float>(g.view_center);
    const float tp = state.transition_progress();
    const float short_arm = TICK_SHORT_ARM_RATIO * g.line_width;
    const float long_arm = TICK_LONG_ARM_RATIO * g.line_width;
    const float short_angle = ARM_ANGLE * tp;
    const float long_angle = -ARM_ANGLE * tp;

    const PointF joint{c, c + short_arm * std::sin(short_angle * DEG_TO_RAD)};
    const PointF short_start = polar(joint, -short_arm, short_angle);
    const PointF long_end = polar(joint, long_arm, long_angle);

    frame.lines.push_back({short_start, joint});
    frame.lines.push_back({joint, long_end});
}

void add_cross(FrameState& frame, const SpinnerState& state, const Geometry& g) {
    const PointF center = g.center();
    const float arm = g.line_width / 2.0f;
    const float angle = ARM_ANGLE * state.transition_progress();

    for (float a : {-angle, 180.0f + angle, 180.0f - angle, angle}) {
        frame.lines.push_back({center, polar(center, arm, a)});
    }
}

void add_exclamation(FrameState& frame, const SpinnerState& state, const Geometry& g) {
    const PointF center = g.center();
    const float tp = state.transition_progress();
    const float arm = g.line_width / 2.0f;
    const float up = -UNKNOWN_ROTATION_ANGLE * tp;
    const float down = 180.0f - UNKNOWN_ROTATION_ANGLE * tp;

    frame.lines.push_back({center, polar(center, arm, up)});
    frame.lines.push_back({center, polar(center, arm, down)});
    frame.dots.push_back({polar(center, arm + UNKNOWN_DOT_DISTANCE * tp, down),
                          STATE_LINE_STROKE / 2.0f, frame.line_color, false, STATE_LINE_STROKE});
}

void add_arc(FrameState& frame, const SpinnerState& state, const Geometry& g, const SpinnerStyle& style) {
    if (state.mode() != DashMode::download) return;

    ArcShape arc;
    arc.center = g.center();
    arc.radius = std::max(0.0f, g.ring_radius - style.ring_width / 2.0f - style.arc_width / 2.0f);
    arc.start_angle = state.arc_position();
    arc.sweep_angle = style.arc_length;
    arc.color = style.arc_color;
    arc.stroke_width = style.arc_width;
    frame.arc = arc;
}

} // namespace

int inner_circle_alpha(float progress) noexcept {
    if (std::isnan(progress)) return 0;
    const long alpha = std::lround(MAX_ALPHA * progress);
    return static_cast<int>(std::clamp(alpha, 0L, static_cast<long>(MAX_ALPHA)));
}

float progress_radius(const Geometry& geometry, float progress) noexcept {
    const float full = static_cast<float>(geometry.inner_circle_radius);
    return std::clamp(full * progress, 0.0f, full);
}

std::string progress_text(float progress) {
    return std::to_string(static_cast<int>(progress * 100.0f)) + "%";
}

PointF polar(PointF start, float length, float degrees) noexcept {
    const float radians = degrees * DEG_TO_RAD;
    return {start.x + length * std::cos(radians), start.y + length * std::sin(radians)};
}

FrameState build_frame(const SpinnerState& state,
                       const Geometry& geometry,
                       const SpinnerStyle& style,
                       const TextMeasure& measure) {
    FrameState frame;
    frame.ring = {geometry.center(), static_cast<float>(geometry.ring_radius),
                  style.outer_ring_color, false, style.ring_width};
    frame.line_color = style.text_color_to;
    frame.line_stroke = STATE_LINE_STROKE;

    if (geometry.size <= 0) {
        return frame;
    }

    add_inner_circle(frame, state, geometry, style);

    switch (state.mode()) {
        case DashMode::download:
        case DashMode::transition_text_and_circle:
            add_progress_content(frame, state, geometry, style, measure);
            break;
        case DashMode::transition_line:
            add_transition_line(frame, state, geometry);
            break;
        case DashMode::success:
            add_tick(frame, state, geometry);
            break;
        case DashMode::failure:
            add_cross(frame, state, geometry);
            break;
        case DashMode::unknown:
            add_exclamation(frame, state, geometry);
            break;
        case DashMode::none:
            break;
    }

    add_arc(frame, state, geometry, style);
    return frame;
}

} // namespace dash::core
