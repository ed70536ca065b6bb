// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dash/core/transition.hpp>

using namespace dash::core;
using namespace std::chrono_literals;

TEST_CASE("decelerate curve", "[transition]") {
    CHECK(decelerate(0.0f) == 0.0f);
    CHECK(decelerate(1.0f) == 1.0f);
    CHECK(decelerate(0.5f) == Catch::Approx(0.75f));

    SECTION("Fast start, slow finish") {
        CHECK(decelerate(0.25f) > 0.25f);
        CHECK(decelerate(0.75f) - decelerate(0.5f) < decelerate(0.25f) - decelerate(0.0f));
    }

    SECTION("Input is clamped") {
        CHECK(decelerate(-1.0f) == 0.0f);
        CHECK(decelerate(2.0f) == 1.0f);
    }
}

TEST_CASE("RampAnimator runs from start to end", "[transition]") {
    RampAnimator ramp(1.0f, 0.0f, 400ms);
    CHECK_FALSE(ramp.running());

    ramp.start();
    REQUIRE(ramp.running());
    CHECK(ramp.value() == 1.0f);

    SECTION("Intermediate samples follow the eased curve") {
        CHECK_FALSE(ramp.advance(200ms));
        CHECK(ramp.value() == Catch::Approx(0.25f));
        CHECK(ramp.running());
    }

    SECTION("Reaching the duration reports completion once") {
        CHECK_FALSE(ramp.advance(399ms));
        CHECK(ramp.advance(1ms));
        CHECK_FALSE(ramp.running());
        CHECK(ramp.value() == 0.0f);
        CHECK_FALSE(ramp.advance(16ms));
    }

    SECTION("Overshooting clamps to the end value") {
        CHECK(ramp.advance(10s));
        CHECK(ramp.value() == 0.0f);
    }

    SECTION("Restarting rewinds") {
        ramp.advance(300ms);
        ramp.start();
        CHECK(ramp.value() == 1.0f);
        CHECK(ramp.fraction() == 0.0f);
    }

    SECTION("Cancelled ramps ignore time") {
        ramp.advance(100ms);
        const float before = ramp.value();
        ramp.cancel();
        CHECK_FALSE(ramp.advance(1s));
        CHECK(ramp.value() == before);
    }
}
