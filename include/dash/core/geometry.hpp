// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

namespace dash::core {

struct PointF {
    float x{0.0f};
    float y{0.0f};

    constexpr bool operator==(const PointF&) const = default;
};

// Values derived from the widget bounds. Rebuilt on every resize.
struct Geometry {
    int size{0};                 // side of the drawing square
    int ring_radius{0};
    int inner_circle_radius{0};
    int view_center{0};
    float line_width{0.0f};      // extent of the status symbols

    [[nodiscard]] static Geometry from_bounds(int width, int height, float ring_width) noexcept;

    [[nodiscard]] PointF center() const noexcept {
        return {static_cast<float>(view_center), static_cast<float>(view_center)};
    }

    constexpr bool operator==(const Geometry&) const = default;
};

} // namespace dash::core
