// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file circle_progress_types.h
 * @brief Constants and style parameters shared by the circle progress widget
 *
 * Colors are plain 0xRRGGBB values so the core does not depend on LVGL.
 * The LVGL backends convert with lv_color_hex().
 */

#include <cstdint>

namespace halo {

/// Progress arc start angles in degrees (0 = right, positive = clockwise)
namespace start_angle {
constexpr float TOP = -90.0f;
constexpr float RIGHT = 0.0f;
constexpr float BOTTOM = 90.0f;
constexpr float LEFT = 180.0f;
} // namespace start_angle

enum class Rotation {
    CLOCKWISE = 360,
    COUNTER_CLOCKWISE = -360,
};

/// Fixed duration of the icon cross-fade, independent of the progress duration
constexpr int ICON_FADE_DURATION_MS = 500;

/**
 * @brief Static visual parameters of the widget
 *
 * Defaults match the widget's initial look: blue border on a white circle,
 * progress starting at the top and running clockwise.
 */
struct CircleProgressStyle {
    int border_width = 10;                   ///< Arc stroke width in pixels
    uint32_t border_color = 0x0000FF;        ///< Arc color
    uint32_t circle_color = 0xFFFFFF;        ///< Fill color
    int shadow_radius = 20;                  ///< Drop shadow blur radius in pixels
    uint32_t shadow_color = 0x000000;        ///< Drop shadow color
    uint8_t shadow_opa = 128;                ///< Drop shadow opacity (0-255)
    int increment_duration_ms = 500;         ///< Progress tween duration
    float start_angle = start_angle::TOP;    ///< Arc start in degrees
    Rotation rotation = Rotation::CLOCKWISE; ///< Sweep direction
};

/// Sign applied to the sweep (+1 clockwise, -1 counter clockwise)
inline float rotation_sign(Rotation rotation) {
    return rotation == Rotation::CLOCKWISE ? 1.0f : -1.0f;
}

} // namespace halo
