// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string_view>

namespace dash::core {

// Visual modes the spinner moves through
enum class DashMode : std::uint8_t {
    none,                      // Nothing reported yet
    download,                  // Progress is being reported
    transition_text_and_circle,// Text collapses to a dot, circle completes
    transition_line,           // Dot stretches into a line
    success,
    failure,
    unknown
};

[[nodiscard]] constexpr bool is_terminal(DashMode mode) noexcept {
    return mode == DashMode::success || mode == DashMode::failure || mode == DashMode::unknown;
}

[[nodiscard]] constexpr std::string_view to_string(DashMode mode) noexcept {
    switch (mode) {
        case DashMode::none:                       return "none";
        case DashMode::download:                   return "download";
        case DashMode::transition_text_and_circle: return "transition_text_and_circle";
        case DashMode::transition_line:            return "transition_line";
        case DashMode::success:                    return "success";
        case DashMode::failure:                    return "failure";
        case DashMode::unknown:                    return "unknown";
    }
    return "invalid";
}

} // namespace dash::core
