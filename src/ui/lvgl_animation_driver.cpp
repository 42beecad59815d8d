// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file lvgl_animation_driver.cpp
 * @brief lv_anim-backed float timelines
 *
 * @gotchas lv_anim keeps a raw pointer to the Timeline. Every path that frees
 *          a Timeline (cancel, completion, driver destruction) must remove
 *          the lv_anim first or be called from lv_anim's own completion.
 */

#include "lvgl_animation_driver.h"

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace halo::ui {

LvglAnimationDriver::~LvglAnimationDriver() {
    std::vector<AnimId> ids;
    for (const auto& entry : timelines_) {
        ids.push_back(entry.first);
    }
    for (AnimId id : ids) {
        cancel(id);
    }
}

AnimId LvglAnimationDriver::start(const AnimSpec& spec, AnimHandler handler) {
    handler({AnimEventType::STARTED, spec.from});

    if (spec.duration_ms <= 0) {
        // lv_anim needs a non-zero duration; deliver the whole timeline now
        handler({AnimEventType::UPDATED, spec.from});
        handler({AnimEventType::UPDATED, spec.to});
        handler({AnimEventType::ENDED, spec.to});
        return NO_ANIM;
    }

    AnimId id = next_id_++;
    auto timeline = std::make_unique<Timeline>(Timeline{this, id, spec, std::move(handler)});
    Timeline* raw = timeline.get();
    timelines_[id] = std::move(timeline);

    lv_anim_t anim;
    lv_anim_init(&anim);
    lv_anim_set_var(&anim, raw);
    lv_anim_set_user_data(&anim, raw);
    lv_anim_set_values(&anim, 0, RESOLUTION);
    lv_anim_set_duration(&anim, static_cast<uint32_t>(spec.duration_ms));
    lv_anim_set_path_cb(&anim, spec.easing == Easing::EASE_IN_OUT ? lv_anim_path_ease_in_out
                                                                  : lv_anim_path_linear);
    lv_anim_set_exec_cb(&anim, exec_cb);
    lv_anim_set_completed_cb(&anim, completed_cb);
    lv_anim_start(&anim); // Applies the start value immediately (UPDATED(from))

    spdlog::trace("[LvglAnimDriver] Started #{} {:.3f} -> {:.3f} over {}ms", id, spec.from,
                  spec.to, spec.duration_ms);

    // The first frame's handler may have cancelled this timeline already
    return timelines_.count(id) ? id : NO_ANIM;
}

bool LvglAnimationDriver::cancel(AnimId id) {
    auto it = timelines_.find(id);
    if (it == timelines_.end()) {
        return false;
    }

    std::unique_ptr<Timeline> timeline = std::move(it->second);
    timelines_.erase(it);
    if (lv_is_initialized()) {
        lv_anim_delete(timeline.get(), nullptr);
    }

    spdlog::trace("[LvglAnimDriver] Cancelled #{}", id);
    timeline->handler({AnimEventType::CANCELLED, 0.0f});
    return true;
}

bool LvglAnimationDriver::is_running(AnimId id) const {
    return timelines_.count(id) > 0;
}

void LvglAnimationDriver::exec_cb(void* var, int32_t value) {
    auto* timeline = static_cast<Timeline*>(var);
    if (!timeline || !timeline->handler) {
        return;
    }

    // Path callbacks already applied easing; map linearly onto the float range
    float t = static_cast<float>(value) / static_cast<float>(RESOLUTION);
    const AnimSpec& spec = timeline->spec;
    float mapped = value >= RESOLUTION ? spec.to : spec.from + (spec.to - spec.from) * t;

    // Copy: the handler may cancel this timeline and free it
    AnimHandler handler = timeline->handler;
    handler({AnimEventType::UPDATED, mapped});
}

void LvglAnimationDriver::completed_cb(lv_anim_t* anim) {
    auto* timeline = static_cast<Timeline*>(lv_anim_get_user_data(anim));
    if (!timeline) {
        return;
    }

    LvglAnimationDriver* driver = timeline->driver;
    auto it = driver->timelines_.find(timeline->id);
    if (it == driver->timelines_.end()) {
        return;
    }

    // Detach before notifying; lv_anim frees its own record after this callback
    std::unique_ptr<Timeline> owned = std::move(it->second);
    driver->timelines_.erase(it);

    spdlog::trace("[LvglAnimDriver] Ended #{}", owned->id);
    owned->handler({AnimEventType::ENDED, owned->spec.to});
}

} // namespace halo::ui
