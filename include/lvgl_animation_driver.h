// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "animation_driver.h"

#include "lvgl/lvgl.h"

#include <memory>
#include <unordered_map>

/**
 * @file lvgl_animation_driver.h
 * @brief AnimationDriver backed by lv_anim
 *
 * lv_anim works on int32 values, so each timeline animates 0..RESOLUTION and
 * maps the result back onto the float range. Frames arrive from
 * lv_timer_handler() at the display refresh rate.
 *
 * @threading UI thread only
 */

namespace halo::ui {

class LvglAnimationDriver : public AnimationDriver {
  public:
    /// Integer steps per timeline
    static constexpr int32_t RESOLUTION = 10000;

    LvglAnimationDriver() = default;
    ~LvglAnimationDriver() override;

    LvglAnimationDriver(const LvglAnimationDriver&) = delete;
    LvglAnimationDriver& operator=(const LvglAnimationDriver&) = delete;

    AnimId start(const AnimSpec& spec, AnimHandler handler) override;
    bool cancel(AnimId id) override;
    bool is_running(AnimId id) const override;

    size_t running_count() const {
        return timelines_.size();
    }

  private:
    /// Passed to lv_anim as both var and user_data
    struct Timeline {
        LvglAnimationDriver* driver;
        AnimId id;
        AnimSpec spec;
        AnimHandler handler;
    };

    static void exec_cb(void* var, int32_t value);
    static void completed_cb(lv_anim_t* anim);

    std::unordered_map<AnimId, std::unique_ptr<Timeline>> timelines_;
    AnimId next_id_ = 1;
};

} // namespace halo::ui
