// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dash/core/frame.hpp>
#include <dash/core/config.hpp>
#include <cmath>

using namespace dash::core;
using namespace std::chrono_literals;

namespace {

float mono_width(std::string_view text, float size) {
    return static_cast<float>(text.size()) * size * 0.6f;
}

const Geometry kGeometry = Geometry::from_bounds(200, 200, SpinnerStyle::DEFAULT_RING_WIDTH);

SpinnerStyle text_style() {
    SpinnerStyle style;
    style.show_progress_text = true;
    return style;
}

} // namespace

TEST_CASE("inner_circle_alpha", "[frame]") {
    CHECK(inner_circle_alpha(0.0f) == 0);
    CHECK(inner_circle_alpha(1.0f) == 255);
    CHECK(inner_circle_alpha(0.5f) == 128);
    CHECK(inner_circle_alpha(0.1f) == 26);
    CHECK(inner_circle_alpha(-1.0f) == 0);
    CHECK(inner_circle_alpha(4.0f) == 255);

    SECTION("Monotonic in progress") {
        int last = 0;
        for (int i = 0; i <= 1000; ++i) {
            const int a = inner_circle_alpha(static_cast<float>(i) / 1000.0f);
            CHECK(a >= last);
            CHECK(a >= 0);
            CHECK(a <= 255);
            last = a;
        }
    }
}

TEST_CASE("progress_text", "[frame]") {
    CHECK(progress_text(0.0f) == "0%");
    CHECK(progress_text(0.429f) == "42%");
    CHECK(progress_text(1.0f) == "100%");
}

TEST_CASE("build_frame idle and download", "[frame]") {
    SpinnerState state;
    const SpinnerStyle style;

    SECTION("Idle draws only the ring") {
        auto frame = build_frame(state, kGeometry, style, mono_width);
        CHECK(frame.ring.radius == 99.0f);
        CHECK(frame.ring.color == style.outer_ring_color);
        CHECK_FALSE(frame.ring.filled);
        CHECK(frame.ring.stroke_width == style.ring_width);
        CHECK(frame.inner_circle.radius == 0.0f);
        CHECK_FALSE(frame.text.has_value());
        CHECK(frame.lines.empty());
        CHECK_FALSE(frame.arc.has_value());
    }

    SECTION("Inner circle grows with progress") {
        state.set_progress(0.5f);
        auto frame = build_frame(state, kGeometry, style, mono_width);
        CHECK(frame.inner_circle.radius == Catch::Approx(49.0f));
        CHECK(frame.inner_circle.filled);
        CHECK(alpha(frame.inner_circle.color) == 128);
        CHECK((frame.inner_circle.color & 0x00ffffffu) == (style.inner_circle_success_color & 0x00ffffffu));
    }

    SECTION("Arc only in download mode") {
        state.set_progress(0.25f);
        state.advance_arc(style.arc_sweep_speed);
        auto frame = build_frame(state, kGeometry, style, mono_width);
        REQUIRE(frame.arc.has_value());
        CHECK(frame.arc->start_angle == Catch::Approx(285.0f));
        CHECK(frame.arc->sweep_angle == style.arc_length);
        CHECK(frame.arc->radius == Catch::Approx(99.0f - 1.0f - 3.0f));
        CHECK(frame.arc->stroke_width == style.arc_width);
    }

    SECTION("No text unless enabled") {
        state.set_progress(0.8f);
        auto frame = build_frame(state, kGeometry, style, mono_width);
        CHECK_FALSE(frame.text.has_value());
    }

    SECTION("Zero-size view draws nothing but the ring") {
        state.set_progress(0.8f);
        auto frame = build_frame(state, Geometry{}, style, mono_width);
        CHECK(frame.inner_circle.radius == 0.0f);
        CHECK_FALSE(frame.arc.has_value());
    }
}

TEST_CASE("build_frame progress text", "[frame][text]") {
    SpinnerState state;
    const auto style = text_style();

    SECTION("Text fits inside the circle and blends its color") {
        state.set_progress(0.5f);
        auto frame = build_frame(state, kGeometry, style, mono_width);
        REQUIRE(frame.text.has_value());
        CHECK(frame.text->text == "50%");
        CHECK(mono_width(frame.text->text, frame.text->size) <= 2.0f * 49.0f - TEXT_PADDING);
        CHECK(frame.text->size <= style.max_text_size);
        CHECK(frame.text->color == blend_colors(style.text_color_from, style.text_color_to, 0.5f));
    }

    SECTION("Capped at the max text size") {
        state.set_progress(1.0f);
        auto frame = build_frame(state, kGeometry, style, mono_width);
        REQUIRE(frame.text.has_value());
        CHECK(frame.text->size == style.max_text_size);
        CHECK(frame.text->color == style.text_color_to);
    }

    SECTION("Too small to draw at the very start") {
        state.set_progress(0.01f);
        auto frame = build_frame(state, kGeometry, style, mono_width);
        CHECK_FALSE(frame.text.has_value());
    }

    SECTION("No measurer, no text") {
        state.set_progress(0.5f);
        auto frame = build_frame(state, kGeometry, style, TextMeasure{});
        CHECK_FALSE(frame.text.has_value());
    }
}

TEST_CASE("build_frame text and circle transition", "[frame]") {
    SpinnerState state;
    const auto style = text_style();
    state.set_progress(0.5f);

    SECTION("Success keeps a full circle and shrinks the text") {
        state.show_success();
        state.advance(100ms);
        auto frame = build_frame(state, kGeometry, style, mono_width);
        CHECK(frame.inner_circle.radius == 98.0f);
        CHECK(alpha(frame.inner_circle.color) == 255);
        REQUIRE(frame.text.has_value());
        CHECK(frame.text->color == style.text_color_to);
        CHECK(mono_width(frame.text->text, frame.text->size)
              <= 2.0f * 49.0f * state.transition_progress() - TEXT_PADDING);
    }

    SECTION("Failure catches up from the download radius and alpha") {
        state.show_failure();
        auto start = build_frame(state, kGeometry, style, mono_width);
        CHECK(start.inner_circle.radius == Catch::Approx(49.0f));
        CHECK(alpha(start.inner_circle.color) == 128);
        CHECK((start.inner_circle.color & 0x00ffffffu) == (style.inner_circle_failure_color & 0x00ffffffu));

        state.advance(200ms);  // eased value 0.25, inverse 0.75
        auto mid = build_frame(state, kGeometry, style, mono_width);
        CHECK(mid.inner_circle.radius == Catch::Approx(49.0f + 49.0f * 0.75f));
        CHECK(alpha(mid.inner_circle.color) == 128 + static_cast<int>(127 * 0.75f));
    }

    SECTION("Collapses to a dot near the end of stage A") {
        state.show_unknown();
        state.advance(300ms);  // eased value 0.0625
        REQUIRE(state.transition_progress() < TEXT_SCALE_DOWN_PERCENT);
        auto frame = build_frame(state, kGeometry, style, mono_width);
        CHECK_FALSE(frame.text.has_value());
        REQUIRE(frame.dots.size() == 1);
        CHECK(frame.dots[0].center == kGeometry.center());
        CHECK(frame.dots[0].radius == STATE_LINE_STROKE / 2.0f);
        CHECK(frame.dots[0].color == style.text_color_to);
        CHECK(frame.dots[0].filled);
    }
}

TEST_CASE("build_frame transition line", "[frame]") {
    SpinnerState state;
    const SpinnerStyle style;
    state.set_progress(1.0f);

    SECTION("Offset toward the tick joint for success") {
        state.show_success();
        state.advance(TRANSITION_DURATION);
        state.advance(TRANSITION_DURATION / 2);  // eased value 0.75
        auto frame = build_frame(state, kGeometry, style, mono_width);
        REQUIRE(frame.lines.size() == 1);
        const float length = 100.0f * 0.75f;
        CHECK(frame.lines[0].from.x == Catch::Approx(100.0f - 0.25f * length));
        CHECK(frame.lines[0].to.x == Catch::Approx(100.0f + 0.75f * length));
        CHECK(frame.lines[0].from.y == 100.0f);
        CHECK(frame.line_color == style.text_color_to);
        CHECK(frame.line_stroke == STATE_LINE_STROKE);
    }

    SECTION("Centered otherwise, on a full failure circle") {
        state.show_failure();
        state.advance(TRANSITION_DURATION);
        state.advance(TRANSITION_DURATION / 2);
        auto frame = build_frame(state, kGeometry, style, mono_width);
        REQUIRE(frame.lines.size() == 1);
        CHECK(frame.lines[0].from.x == Catch::Approx(100.0f - 37.5f));
        CHECK(frame.lines[0].to.x == Catch::Approx(100.0f + 37.5f));
        CHECK(frame.inner_circle.radius == 98.0f);
        CHECK(frame.inner_circle.color == with_alpha(style.inner_circle_failure_color, 255));
    }
}

TEST_CASE("build_frame status symbols", "[frame]") {
    SpinnerState state;
    const SpinnerStyle style;

    auto finish = [&state] {
        state.advance(TRANSITION_DURATION);
        state.advance(TRANSITION_DURATION);
        state.advance(TRANSITION_DURATION);
    };

    SECTION("Tick starts where the line ended and bends at the center") {
        state.show_success();
        state.advance(TRANSITION_DURATION);
        state.advance(TRANSITION_DURATION);
        REQUIRE(state.mode() == DashMode::success);
        auto flat = build_frame(state, kGeometry, style, mono_width);
        REQUIRE(flat.lines.size() == 2);
        CHECK(flat.lines[0].from.x == Catch::Approx(75.0f));
        CHECK(flat.lines[1].to.x == Catch::Approx(175.0f));
        CHECK(flat.lines[1].to.y == Catch::Approx(100.0f));

        state.advance(TRANSITION_DURATION);
        auto tick = build_frame(state, kGeometry, style, mono_width);
        REQUIRE(tick.lines.size() == 2);
        const float s = 25.0f;
        const float l = 75.0f;
        const float d = std::sqrt(0.5f);
        const PointF joint{100.0f, 100.0f + s * d};
        CHECK(tick.lines[0].to.x == Catch::Approx(joint.x));
        CHECK(tick.lines[0].to.y == Catch::Approx(joint.y));
        CHECK(tick.lines[0].from.x == Catch::Approx(100.0f - s * d));
        CHECK(tick.lines[0].from.y == Catch::Approx(100.0f));
        CHECK(tick.lines[1].from.x == Catch::Approx(joint.x));
        CHECK(tick.lines[1].to.x == Catch::Approx(joint.x + l * d));
        CHECK(tick.lines[1].to.y == Catch::Approx(joint.y - l * d));
        CHECK(tick.inner_circle.color == with_alpha(style.inner_circle_success_color, 255));
        CHECK_FALSE(tick.arc.has_value());
    }

    SECTION("Cross has four arms of half the line width") {
        state.show_failure();
        finish();
        auto frame = build_frame(state, kGeometry, style, mono_width);
        REQUIRE(frame.lines.size() == 4);
        for (const auto& line : frame.lines) {
            CHECK(line.from == kGeometry.center());
            const float dx = line.to.x - 100.0f;
            const float dy = line.to.y - 100.0f;
            CHECK(std::hypot(dx, dy) == Catch::Approx(50.0f));
            CHECK(std::abs(dx) == Catch::Approx(std::abs(dy)));
        }
        CHECK(frame.inner_circle.color == with_alpha(style.inner_circle_failure_color, 255));
    }

    SECTION("Exclamation is vertical with a dot below") {
        state.show_unknown();
        finish();
        auto frame = build_frame(state, kGeometry, style, mono_width);
        REQUIRE(frame.lines.size() == 2);
        CHECK(frame.lines[0].to.x == Catch::Approx(100.0f).margin(1e-3));
        CHECK(frame.lines[0].to.y == Catch::Approx(50.0f));
        CHECK(frame.lines[1].to.x == Catch::Approx(100.0f).margin(1e-3));
        CHECK(frame.lines[1].to.y == Catch::Approx(150.0f));

        REQUIRE(frame.dots.size() == 1);
        CHECK(frame.dots[0].center.y == Catch::Approx(150.0f + UNKNOWN_DOT_DISTANCE));
        CHECK_FALSE(frame.dots[0].filled);
        CHECK(frame.inner_circle.color == with_alpha(style.inner_circle_unknown_color, 255));
    }

    SECTION("Exclamation starts as a flat line") {
        state.show_unknown();
        state.advance(TRANSITION_DURATION);
        state.advance(TRANSITION_DURATION);
        auto frame = build_frame(state, kGeometry, style, mono_width);
        REQUIRE(frame.lines.size() == 2);
        CHECK(frame.lines[0].to.x == Catch::Approx(150.0f));
        CHECK(frame.lines[1].to.x == Catch::Approx(50.0f));
        CHECK(frame.dots[0].center.x == Catch::Approx(50.0f));
    }
}
