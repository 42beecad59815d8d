// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file render_surface.h
 * @brief Draw primitives the circle progress widget renders with
 *
 * Coordinates are relative to the widget's top-left corner. Angles are in
 * degrees, 0 = 3 o'clock, increasing clockwise (screen y grows downward).
 */

#include "icon_loader.h"

#include <cstdint>

namespace halo {

struct SurfaceRect {
    int32_t left;
    int32_t top;
    int32_t right;
    int32_t bottom;
};

class RenderSurface {
  public:
    virtual ~RenderSurface() = default;

    virtual int32_t width() const = 0;
    virtual int32_t height() const = 0;

    /// Circle whose only visible output is its blurred drop shadow
    virtual void draw_shadow_circle(int32_t cx, int32_t cy, int32_t radius, int32_t blur,
                                    uint32_t color, uint8_t opa) = 0;

    virtual void fill_circle(int32_t cx, int32_t cy, int32_t radius, uint32_t color) = 0;

    /**
     * @brief Stroke an arc inscribed in @p bounds
     * @param start_angle Start in degrees
     * @param sweep_angle Signed extent in degrees (negative = counter clockwise)
     */
    virtual void stroke_arc(const SurfaceRect& bounds, float start_angle, float sweep_angle,
                            int32_t stroke_width, uint32_t color) = 0;

    /// Blit @p icon with its top-left corner at (x, y)
    virtual void draw_image(const IconImage& icon, int32_t x, int32_t y, uint8_t opa) = 0;
};

} // namespace halo
