// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "render_surface.h"

#include <string>
#include <vector>

/**
 * @brief RenderSurface that records every primitive instead of drawing
 *
 * Each call appends one DrawOp so tests can check order, geometry and
 * alpha of a frame.
 */
class RecordingSurface : public halo::RenderSurface {
  public:
    enum class OpType { SHADOW, FILL, ARC, IMAGE };

    struct DrawOp {
        OpType type;
        int32_t cx = 0;
        int32_t cy = 0;
        int32_t radius = 0;
        int32_t blur = 0;
        uint32_t color = 0;
        uint8_t opa = 0;
        halo::SurfaceRect bounds{0, 0, 0, 0};
        float start_angle = 0.0f;
        float sweep_angle = 0.0f;
        int32_t stroke_width = 0;
        std::string image_source;
        int32_t x = 0;
        int32_t y = 0;
    };

    RecordingSurface(int32_t width, int32_t height) : width_(width), height_(height) {}

    int32_t width() const override {
        return width_;
    }

    int32_t height() const override {
        return height_;
    }

    void draw_shadow_circle(int32_t cx, int32_t cy, int32_t radius, int32_t blur, uint32_t color,
                            uint8_t opa) override {
        DrawOp op{OpType::SHADOW};
        op.cx = cx;
        op.cy = cy;
        op.radius = radius;
        op.blur = blur;
        op.color = color;
        op.opa = opa;
        ops.push_back(op);
    }

    void fill_circle(int32_t cx, int32_t cy, int32_t radius, uint32_t color) override {
        DrawOp op{OpType::FILL};
        op.cx = cx;
        op.cy = cy;
        op.radius = radius;
        op.color = color;
        ops.push_back(op);
    }

    void stroke_arc(const halo::SurfaceRect& bounds, float start_angle, float sweep_angle,
                    int32_t stroke_width, uint32_t color) override {
        DrawOp op{OpType::ARC};
        op.bounds = bounds;
        op.start_angle = start_angle;
        op.sweep_angle = sweep_angle;
        op.stroke_width = stroke_width;
        op.color = color;
        ops.push_back(op);
    }

    void draw_image(const halo::IconImage& icon, int32_t x, int32_t y, uint8_t opa) override {
        DrawOp op{OpType::IMAGE};
        op.image_source = icon.source;
        op.x = x;
        op.y = y;
        op.opa = opa;
        ops.push_back(op);
    }

    std::vector<OpType> op_types() const {
        std::vector<OpType> types;
        for (const auto& op : ops) {
            types.push_back(op.type);
        }
        return types;
    }

    std::vector<DrawOp> images() const {
        std::vector<DrawOp> result;
        for (const auto& op : ops) {
            if (op.type == OpType::IMAGE) {
                result.push_back(op);
            }
        }
        return result;
    }

    void clear() {
        ops.clear();
    }

    std::vector<DrawOp> ops;

  private:
    int32_t width_;
    int32_t height_;
};
