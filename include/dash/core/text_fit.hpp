// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <functional>
#include <string_view>

namespace dash::core {

// Width of `text` when rendered at `size` pixels
using TextMeasure = std::function<float(std::string_view text, float size)>;

// Largest size in [low, high] whose rendered width fits target_width, found by
// binary search down to `precision`. Returns high if the text already fits at
// high, and low if it does not fit even at low.
[[nodiscard]] float fit_text_size(std::string_view text,
                                  float target_width,
                                  float low,
                                  float high,
                                  float precision,
                                  const TextMeasure& measure);

} // namespace dash::core
