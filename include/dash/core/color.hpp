// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dash::core {

// 0xAARRGGBB, same layout as QRgb
using Argb = std::uint32_t;

[[nodiscard]] constexpr std::uint8_t alpha(Argb c) noexcept { return static_cast<std::uint8_t>(c >> 24); }
[[nodiscard]] constexpr std::uint8_t red(Argb c) noexcept { return static_cast<std::uint8_t>(c >> 16); }
[[nodiscard]] constexpr std::uint8_t green(Argb c) noexcept { return static_cast<std::uint8_t>(c >> 8); }
[[nodiscard]] constexpr std::uint8_t blue(Argb c) noexcept { return static_cast<std::uint8_t>(c); }

[[nodiscard]] constexpr Argb rgb(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept {
    return 0xff000000u
         | (static_cast<Argb>(r) << 16)
         | (static_cast<Argb>(g) << 8)
         | static_cast<Argb>(b);
}

[[nodiscard]] constexpr Argb with_alpha(Argb c, int a) noexcept {
    a = a < 0 ? 0 : (a > 255 ? 255 : a);
    return (c & 0x00ffffffu) | (static_cast<Argb>(a) << 24);
}

// Per-channel linear blend, truncated. Result is opaque.
[[nodiscard]] Argb blend_colors(Argb from, Argb to, float ratio) noexcept;

// "#RRGGBB" or "#AARRGGBB"
[[nodiscard]] std::optional<Argb> parse_color(std::string_view str) noexcept;
[[nodiscard]] std::string format_color(Argb c);

} // namespace dash::core
