// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dash/core/text_fit.hpp>
#include <algorithm>

namespace dash::core {

float fit_text_size(std::string_view text,
                    float target_width,
                    float low,
                    float high,
                    float precision,
                    const TextMeasure& measure) {
    if (high < low) std::swap(low, high);
    precision = std::max(precision, 1e-3f);

    if (measure(text, high) <= target_width) return high;
    if (measure(text, low) >= target_width) return low;

    while ((high - low) >= precision) {
        const float mid = (low + high) / 2.0f;
        const float width = measure(text, mid);

        if (width > target_width) {
            high = mid;
        } else if (width < target_width) {
            low = mid;
        } else {
            return mid;
        }
    }
    return low;
}

} // namespace dash::core
