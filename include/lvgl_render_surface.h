// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "render_surface.h"

#include "lvgl/lvgl.h"

/**
 * @file lvgl_render_surface.h
 * @brief RenderSurface drawing into an lv_layer_t during a draw event
 *
 * Widget-relative coordinates are offset by the object's screen coordinates.
 * Only valid for the duration of the LV_EVENT_DRAW_MAIN handler it was
 * created in.
 */

namespace halo::ui {

class LvglRenderSurface : public RenderSurface {
  public:
    LvglRenderSurface(lv_layer_t* layer, const lv_area_t& coords);

    int32_t width() const override;
    int32_t height() const override;

    void draw_shadow_circle(int32_t cx, int32_t cy, int32_t radius, int32_t blur, uint32_t color,
                            uint8_t opa) override;
    void fill_circle(int32_t cx, int32_t cy, int32_t radius, uint32_t color) override;
    void stroke_arc(const SurfaceRect& bounds, float start_angle, float sweep_angle,
                    int32_t stroke_width, uint32_t color) override;
    void draw_image(const IconImage& icon, int32_t x, int32_t y, uint8_t opa) override;

  private:
    lv_area_t circle_area(int32_t cx, int32_t cy, int32_t radius) const;

    lv_layer_t* layer_;
    lv_area_t coords_;
};

/**
 * @brief Convert a signed sweep into LVGL's clockwise [start, end] angles
 *
 * LVGL arcs always run clockwise from start to end, with 0..360 degrees.
 * Negative sweeps are drawn from (start + sweep) to start. A sweep of 360
 * degrees or more yields a full ring.
 */
void arc_angles_for_sweep(float start_angle, float sweep_angle, float& out_start,
                          float& out_end);

} // namespace halo::ui
