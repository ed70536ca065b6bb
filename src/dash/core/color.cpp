// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dash/core/color.hpp>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>

namespace dash::core {

Argb blend_colors(Argb from, Argb to, float ratio) noexcept {
    if (std::isnan(ratio)) ratio = 0.0f;
    ratio = std::clamp(ratio, 0.0f, 1.0f);
    const float inverse = 1.0f - ratio;

    const float r = red(to) * ratio + red(from) * inverse;
    const float g = green(to) * ratio + green(from) * inverse;
    const float b = blue(to) * ratio + blue(from) * inverse;

    return rgb(static_cast<std::uint8_t>(r),
               static_cast<std::uint8_t>(g),
               static_cast<std::uint8_t>(b));
}

std::optional<Argb> parse_color(std::string_view str) noexcept {
    if (str.empty() || str.front() != '#') return std::nullopt;
    str.remove_prefix(1);
    if (str.size() != 6 && str.size() != 8) return std::nullopt;

    Argb value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value, 16);
    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
    }

    if (str.size() == 6) {
        value |= 0xff000000u;
    }
    return value;
}

std::string format_color(Argb c) {
    if (alpha(c) == 0xff) {
        return std::format("#{:06X}", c & 0x00ffffffu);
    }
    return std::format("#{:08X}", c);
}

} // namespace dash::core
