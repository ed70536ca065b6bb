// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dash/core/color.hpp>

using namespace dash::core;

TEST_CASE("blend_colors end points", "[color]") {
    const Argb from = rgb(0x10, 0x80, 0xf0);
    const Argb to = rgb(0xf0, 0x20, 0x00);

    SECTION("Ratio 0 gives the start color") {
        CHECK(blend_colors(from, to, 0.0f) == from);
    }

    SECTION("Ratio 1 gives the end color") {
        CHECK(blend_colors(from, to, 1.0f) == to);
    }

    SECTION("Out of range ratios are clamped") {
        CHECK(blend_colors(from, to, -3.0f) == from);
        CHECK(blend_colors(from, to, 7.0f) == to);
    }
}

TEST_CASE("blend_colors is per-channel linear", "[color]") {
    SECTION("Black to white at half way") {
        auto mid = blend_colors(rgb(0, 0, 0), rgb(255, 255, 255), 0.5f);
        CHECK(red(mid) == 127);
        CHECK(green(mid) == 127);
        CHECK(blue(mid) == 127);
        CHECK(alpha(mid) == 255);
    }

    SECTION("Channels move independently") {
        auto c = blend_colors(rgb(100, 0, 200), rgb(200, 100, 0), 0.25f);
        CHECK(red(c) == 125);
        CHECK(green(c) == 25);
        CHECK(blue(c) == 150);
    }
}

TEST_CASE("with_alpha", "[color]") {
    CHECK(with_alpha(0xff123456u, 0) == 0x00123456u);
    CHECK(with_alpha(0x00123456u, 128) == 0x80123456u);
    CHECK(with_alpha(0xff123456u, 999) == 0xff123456u);
    CHECK(with_alpha(0xff123456u, -5) == 0x00123456u);
}

TEST_CASE("parse_color", "[color]") {
    SECTION("RGB is made opaque") {
        auto c = parse_color("#99CC00");
        REQUIRE(c.has_value());
        CHECK(*c == 0xff99cc00u);
    }

    SECTION("ARGB keeps its alpha") {
        auto c = parse_color("#80ff4444");
        REQUIRE(c.has_value());
        CHECK(*c == 0x80ff4444u);
    }

    SECTION("Malformed strings are rejected") {
        CHECK_FALSE(parse_color("").has_value());
        CHECK_FALSE(parse_color("99CC00").has_value());
        CHECK_FALSE(parse_color("#99CC0").has_value());
        CHECK_FALSE(parse_color("#99CCZZ").has_value());
        CHECK_FALSE(parse_color("#-9CC00").has_value());
    }

    SECTION("format_color is the inverse") {
        CHECK(format_color(0xff0099ccu) == "#0099CC");
        CHECK(format_color(0x400099ccu) == "#400099CC");
    }
}
