// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dash/core/geometry.hpp>
#include <dash/core/config.hpp>
#include <algorithm>

namespace dash::core {

Geometry Geometry::from_bounds(int width, int height, float ring_width) noexcept {
    Geometry g;
    g.size = std::max(0, std::min(width, height));
    if (g.size == 0) {
        return g;
    }

    ring_width = std::max(0.0f, ring_width);
    g.ring_radius = std::max(0, static_cast<int>((g.size - ring_width) / 2));
    g.inner_circle_radius = std::max(0, static_cast<int>((g.size - ring_width * 2) / 2));
    g.view_center = g.size / 2;
    g.line_width = STATUS_SYMBOL_WIDTH_PERCENT * static_cast<float>(g.size);
    return g;
}

} // namespace dash::core
