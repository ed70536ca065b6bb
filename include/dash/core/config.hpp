// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>

namespace dash::core {

// Stage timing
constexpr std::chrono::milliseconds TRANSITION_DURATION{400};
constexpr std::chrono::milliseconds SETTLE_DELAY{TRANSITION_DURATION};  // pause before notifying
constexpr std::chrono::milliseconds FRAME_INTERVAL{16};                 // ~60 FPS

// Ramp end points. Stage A runs start -> end, stages B and C run end -> start.
constexpr float TRANSITION_START_VALUE = 1.0f;
constexpr float TRANSITION_END_VALUE = 0.0f;

// Arc
constexpr float CIRCULAR_FACTOR = 360.0f;

// Status symbols
constexpr float STATUS_SYMBOL_WIDTH_PERCENT = 0.5f;   // share of the size used by tick/cross/line
constexpr float TEXT_SCALE_DOWN_PERCENT = 0.1f;       // below this the text collapses to a dot
constexpr float STATE_LINE_STROKE = 4.0f;             // px
constexpr float TICK_SHORT_ARM_RATIO = 0.25f;
constexpr float TICK_LONG_ARM_RATIO = 0.75f;
constexpr float ARM_ANGLE = 45.0f;                    // degrees
constexpr float UNKNOWN_DOT_DISTANCE = 10.0f;         // final gap between line and dot, px
constexpr float UNKNOWN_ROTATION_ANGLE = 90.0f;       // degrees

// Progress text
constexpr float TEXT_PADDING = 8.0f;                  // px
constexpr float TEXT_SIZE_PRECISION = 0.5f;
constexpr float MIN_DRAWABLE_TEXT_SIZE = 1.0f;

constexpr int MAX_ALPHA = 255;

} // namespace dash::core
