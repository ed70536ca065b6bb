// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dash/core/color.hpp>
#include <dash/core/dash_mode.hpp>
#include <dash/core/error.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace dash::core {

// Look of a spinner. Fixed once the widget is constructed.
struct SpinnerStyle {
    static constexpr float DEFAULT_ARC_START_POSITION = 270.0f;
    static constexpr float DEFAULT_ARC_SWEEP_SPEED = 20.0f;
    static constexpr float DEFAULT_ARC_WIDTH = 6.0f;
    static constexpr float DEFAULT_RING_WIDTH = 2.0f;
    static constexpr float DEFAULT_MAX_TEXT_SIZE = 40.0f;
    static constexpr float DEFAULT_ARC_LENGTH = 90.0f;

    Argb outer_ring_color{0xff0099ccu};
    Argb arc_color{0xffffffffu};
    Argb inner_circle_success_color{0xff99cc00u};
    Argb inner_circle_failure_color{0xffff4444u};
    Argb inner_circle_unknown_color{0xffffbb33u};
    Argb text_color_from{0xff000000u};
    Argb text_color_to{0xffffffffu};

    float arc_start_position{DEFAULT_ARC_START_POSITION};  // degrees
    float arc_sweep_speed{DEFAULT_ARC_SWEEP_SPEED};        // degrees per frame at 0%
    float arc_width{DEFAULT_ARC_WIDTH};                    // px
    float ring_width{DEFAULT_RING_WIDTH};                  // px
    float max_text_size{DEFAULT_MAX_TEXT_SIZE};            // px
    bool show_progress_text{false};
    float arc_length{DEFAULT_ARC_LENGTH};                  // degrees

    // Inner circle color for a terminal mode (success color otherwise)
    [[nodiscard]] Argb inner_circle_color(DashMode mode) const noexcept;

    // Missing keys keep their defaults, unknown keys are ignored
    [[nodiscard]] static std::expected<SpinnerStyle, std::error_code> from_json(std::string_view json) noexcept;
    [[nodiscard]] static std::expected<SpinnerStyle, std::error_code> load(const std::filesystem::path& path) noexcept;

    [[nodiscard]] std::string to_json() const;
};

} // namespace dash::core
