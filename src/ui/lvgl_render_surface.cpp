// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_render_surface.h"

#include <algorithm>
#include <cmath>

namespace halo::ui {

namespace {

float normalize_angle(float degrees) {
    float a = std::fmod(degrees, 360.0f);
    return a < 0.0f ? a + 360.0f : a;
}

} // namespace

void arc_angles_for_sweep(float start_angle, float sweep_angle, float& out_start,
                          float& out_end) {
    if (std::fabs(sweep_angle) >= 360.0f) {
        out_start = 0.0f;
        out_end = 360.0f;
        return;
    }

    if (sweep_angle >= 0.0f) {
        out_start = normalize_angle(start_angle);
        out_end = normalize_angle(start_angle + sweep_angle);
    } else {
        out_start = normalize_angle(start_angle + sweep_angle);
        out_end = normalize_angle(start_angle);
    }
}

LvglRenderSurface::LvglRenderSurface(lv_layer_t* layer, const lv_area_t& coords)
    : layer_(layer), coords_(coords) {}

int32_t LvglRenderSurface::width() const {
    return lv_area_get_width(&coords_);
}

int32_t LvglRenderSurface::height() const {
    return lv_area_get_height(&coords_);
}

lv_area_t LvglRenderSurface::circle_area(int32_t cx, int32_t cy, int32_t radius) const {
    lv_area_t area;
    area.x1 = coords_.x1 + cx - radius;
    area.y1 = coords_.y1 + cy - radius;
    area.x2 = coords_.x1 + cx + radius - 1;
    area.y2 = coords_.y1 + cy + radius - 1;
    return area;
}

void LvglRenderSurface::draw_shadow_circle(int32_t cx, int32_t cy, int32_t radius, int32_t blur,
                                           uint32_t color, uint8_t opa) {
    if (radius <= 0) {
        return;
    }

    lv_draw_rect_dsc_t dsc;
    lv_draw_rect_dsc_init(&dsc);
    dsc.radius = LV_RADIUS_CIRCLE;
    dsc.bg_opa = LV_OPA_TRANSP;
    dsc.border_width = 0;
    dsc.shadow_width = blur;
    dsc.shadow_color = lv_color_hex(color);
    dsc.shadow_opa = opa;
    dsc.shadow_offset_x = 0;
    dsc.shadow_offset_y = 0;
    dsc.shadow_spread = 0;

    lv_area_t area = circle_area(cx, cy, radius);
    lv_draw_rect(layer_, &dsc, &area);
}

void LvglRenderSurface::fill_circle(int32_t cx, int32_t cy, int32_t radius, uint32_t color) {
    if (radius <= 0) {
        return;
    }

    lv_draw_rect_dsc_t dsc;
    lv_draw_rect_dsc_init(&dsc);
    dsc.radius = LV_RADIUS_CIRCLE;
    dsc.bg_color = lv_color_hex(color);
    dsc.bg_opa = LV_OPA_COVER;
    dsc.border_width = 0;

    lv_area_t area = circle_area(cx, cy, radius);
    lv_draw_rect(layer_, &dsc, &area);
}

void LvglRenderSurface::stroke_arc(const SurfaceRect& bounds, float start_angle,
                                   float sweep_angle, int32_t stroke_width, uint32_t color) {
    int32_t rect_w = bounds.right - bounds.left;
    int32_t rect_h = bounds.bottom - bounds.top;
    if (rect_w <= 0 || rect_h <= 0 || stroke_width <= 0 || sweep_angle == 0.0f) {
        return;
    }

    float start = 0.0f;
    float end = 0.0f;
    arc_angles_for_sweep(start_angle, sweep_angle, start, end);

    // bounds are the stroke's center line; LVGL's radius is the outer edge
    int32_t center_radius = std::min(rect_w, rect_h) / 2;

    lv_draw_arc_dsc_t dsc;
    lv_draw_arc_dsc_init(&dsc);
    dsc.center.x = coords_.x1 + bounds.left + rect_w / 2;
    dsc.center.y = coords_.y1 + bounds.top + rect_h / 2;
    dsc.radius = static_cast<uint16_t>(center_radius + stroke_width / 2);
    dsc.width = stroke_width;
    dsc.start_angle = start;
    dsc.end_angle = end;
    dsc.color = lv_color_hex(color);
    dsc.opa = LV_OPA_COVER;
    dsc.rounded = 0;

    lv_draw_arc(layer_, &dsc);
}

void LvglRenderSurface::draw_image(const IconImage& icon, int32_t x, int32_t y, uint8_t opa) {
    if (opa == LV_OPA_TRANSP) {
        return;
    }

    lv_draw_image_dsc_t dsc;
    lv_draw_image_dsc_init(&dsc);
    dsc.src = icon.image_src ? icon.image_src : icon.source.c_str();
    dsc.opa = opa;

    lv_area_t area;
    area.x1 = coords_.x1 + x;
    area.y1 = coords_.y1 + y;
    area.x2 = area.x1 + icon.width - 1;
    area.y2 = area.y1 + icon.height - 1;
    lv_draw_image(layer_, &dsc, &area);
}

} // namespace halo::ui
