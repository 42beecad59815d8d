// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file circle_progress.cpp
 * @brief Progress state machine, frame renderer and icon cross-fade
 *
 * @pattern Backend-agnostic core; LVGL glue in ui/ui_circle_progress.cpp
 * @threading Public mutators re-dispatch to the UI thread via UiDispatcher
 * @gotchas Animation handlers can run reentrantly from inside driver_.start()
 *          and driver_.cancel(); serial numbers keep stale handlers from
 *          clearing the handle of a newer animation.
 */

#include "circle_progress.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace halo {

CircleGeometry compute_circle_geometry(int32_t width, int32_t height,
                                       const CircleProgressStyle& style) {
    CircleGeometry geo;
    geo.cx = width / 2;
    geo.cy = height / 2;
    geo.radius = width / 2 - style.shadow_radius;

    // Inset so the stroke sits inside the shadow margin
    int32_t delta = style.shadow_radius + style.border_width / 2;
    geo.arc_rect = {delta, delta, width - delta, height - delta};
    return geo;
}

CircleProgress::CircleProgress(AnimationDriver& driver, UiDispatcher& dispatcher,
                               IconLoader& loader, RepaintCallback repaint)
    : driver_(driver), dispatcher_(dispatcher), loader_(loader), repaint_(std::move(repaint)) {
    spdlog::debug("[CircleProgress] Created (border={}px, shadow={}px, duration={}ms)",
                  style_.border_width, style_.shadow_radius, style_.increment_duration_ms);
}

CircleProgress::~CircleProgress() {
    // Invalidate queued work first, then stop timelines without repainting
    alive_.reset();
    repaint_ = nullptr;
    cancel_progress_tween();
    cancel_fade(false);
}

// ============================================================================
// Dispatch
// ============================================================================

void CircleProgress::mutate(const char* op, UiDispatcher::Work work) {
    if (dispatcher_.is_ui_thread()) {
        work();
        return;
    }

    spdlog::trace("[CircleProgress] {}() called off the UI thread, queueing", op);
    std::weak_ptr<bool> alive = alive_;
    dispatcher_.post([alive, op, work = std::move(work)]() {
        if (alive.expired()) {
            spdlog::debug("[CircleProgress] Dropping queued {}() for destroyed widget", op);
            return;
        }
        try {
            work();
        } catch (const ResourceNotFound& e) {
            // No caller to propagate to once the work has been queued
            spdlog::error("[CircleProgress] Queued {}() failed: {}", op, e.what());
        }
    });
}

void CircleProgress::request_repaint() {
    if (repaint_) {
        repaint_();
    }
}

// ============================================================================
// Configuration
// ============================================================================

void CircleProgress::set_increment_duration(int duration_ms) {
    mutate("set_increment_duration", [this, duration_ms]() {
        style_.increment_duration_ms = std::max(0, duration_ms);
    });
}

void CircleProgress::set_start_angle(float degrees) {
    mutate("set_start_angle", [this, degrees]() {
        style_.start_angle = degrees;
        request_repaint();
    });
}

void CircleProgress::set_on_complete(CompleteCallback callback) {
    mutate("set_on_complete",
           [this, callback = std::move(callback)]() mutable { on_complete_ = std::move(callback); });
}

void CircleProgress::set_border_width(int width) {
    mutate("set_border_width", [this, width]() {
        style_.border_width = std::max(0, width);
        request_repaint();
    });
}

void CircleProgress::set_border_color(uint32_t color) {
    mutate("set_border_color", [this, color]() {
        style_.border_color = color;
        request_repaint();
    });
}

void CircleProgress::set_circle_color(uint32_t color) {
    mutate("set_circle_color", [this, color]() {
        style_.circle_color = color;
        request_repaint();
    });
}

void CircleProgress::set_shadow_radius(int radius) {
    mutate("set_shadow_radius", [this, radius]() {
        style_.shadow_radius = std::max(0, radius);
        request_repaint();
    });
}

void CircleProgress::set_rotation_clockwise(bool clockwise) {
    mutate("set_rotation_clockwise", [this, clockwise]() {
        style_.rotation = clockwise ? Rotation::CLOCKWISE : Rotation::COUNTER_CLOCKWISE;
        request_repaint();
    });
}

void CircleProgress::apply_style(const CircleProgressStyle& style) {
    mutate("apply_style", [this, style]() {
        style_ = style;
        style_.border_width = std::max(0, style_.border_width);
        style_.shadow_radius = std::max(0, style_.shadow_radius);
        style_.increment_duration_ms = std::max(0, style_.increment_duration_ms);
        request_repaint();
    });
}

void CircleProgress::set_repaint_callback(RepaintCallback repaint) {
    mutate("set_repaint_callback",
           [this, repaint = std::move(repaint)]() mutable { repaint_ = std::move(repaint); });
}

// ============================================================================
// Progress state machine
// ============================================================================

void CircleProgress::animate_progress(float value) {
    if (!std::isfinite(value)) {
        spdlog::warn("[CircleProgress] Ignoring non-finite progress {}", value);
        return;
    }
    float to = std::clamp(value, 0.0f, 1.0f);
    mutate("animate_progress", [this, to]() { start_progress_tween(to); });
}

void CircleProgress::start_progress_tween(float to) {
    float heading = is_animating() ? progress_anim_to_ : target_progress_;
    if (to == heading) {
        spdlog::trace("[CircleProgress] Already heading to {:.3f}, ignoring", to);
        return;
    }

    if (is_animating()) {
        spdlog::debug("[CircleProgress] Superseding {:.3f} with {:.3f} at {:.3f}",
                      progress_anim_to_, to, current_progress_);
        superseding_target_ = to;
        cancel_progress_tween();
    }

    uint32_t serial = ++progress_serial_;
    progress_anim_to_ = to;

    AnimSpec spec;
    spec.from = current_progress_;
    spec.to = to;
    spec.duration_ms = style_.increment_duration_ms;
    spec.easing = Easing::EASE_IN_OUT;

    spdlog::debug("[CircleProgress] Animating {:.3f} -> {:.3f} over {}ms", spec.from, spec.to,
                  spec.duration_ms);

    AnimId id = driver_.start(spec, [this, serial, to](const AnimEvent& event) {
        handle_progress_event(serial, to, event);
    });

    // A zero-duration tween has already ended, possibly starting a newer one
    if (serial == progress_serial_ && id != NO_ANIM) {
        progress_anim_ = id;
    }
}

void CircleProgress::handle_progress_event(uint32_t serial, float to, const AnimEvent& event) {
    switch (event.type) {
    case AnimEventType::STARTED:
        break;

    case AnimEventType::UPDATED:
        current_progress_ = std::clamp(event.value, 0.0f, 1.0f);
        spdlog::trace("[CircleProgress] Progress {:.3f}", current_progress_);
        request_repaint();
        break;

    case AnimEventType::ENDED:
        if (serial == progress_serial_) {
            progress_anim_ = NO_ANIM;
        }
        target_progress_ = to;
        spdlog::debug("[CircleProgress] Reached {:.3f}", current_progress_);
        if (current_progress_ >= 1.0f && on_complete_) {
            spdlog::debug("[CircleProgress] Complete, invoking callback");
            // Copy: the callback may replace itself
            CompleteCallback callback = on_complete_;
            callback();
        }
        break;

    case AnimEventType::CANCELLED:
        target_progress_ = superseding_target_;
        spdlog::trace("[CircleProgress] Tween to {:.3f} cancelled, target now {:.3f}", to,
                      target_progress_);
        break;
    }
}

void CircleProgress::cancel_progress_tween() {
    AnimId id = std::exchange(progress_anim_, NO_ANIM);
    if (id != NO_ANIM) {
        driver_.cancel(id);
    }
}

void CircleProgress::reset() {
    mutate("reset", [this]() {
        superseding_target_ = 0.0f;
        cancel_progress_tween();
        current_progress_ = 0.0f;
        target_progress_ = 0.0f;
        spdlog::debug("[CircleProgress] Reset");
        request_repaint();
    });
}

void CircleProgress::stop_animations() {
    mutate("stop_animations", [this]() {
        if (is_animating()) {
            superseding_target_ = current_progress_;
            cancel_progress_tween();
            spdlog::debug("[CircleProgress] Stopped at {:.3f}", current_progress_);
        }
        cancel_fade(true);
        request_repaint();
    });
}

float CircleProgress::sweep_angle() const {
    return static_cast<float>(static_cast<int>(style_.rotation)) * current_progress_;
}

// ============================================================================
// Icons
// ============================================================================

void CircleProgress::set_icon(const std::string& resource) {
    mutate("set_icon", [this, resource]() {
        IconPtr loaded = loader_.load(resource);
        cancel_fade(false);
        next_icon_.reset();
        fade_alpha_ = 0.0f;
        icon_ = std::move(loaded);
        spdlog::debug("[CircleProgress] Icon set to '{}' ({}x{})", resource, icon_->width,
                      icon_->height);
        request_repaint();
    });
}

void CircleProgress::animate_next_image(const std::string& resource) {
    mutate("animate_next_image", [this, resource]() { start_fade(loader_.load(resource)); });
}

void CircleProgress::clear_icon() {
    mutate("clear_icon", [this]() {
        cancel_fade(false);
        icon_.reset();
        next_icon_.reset();
        fade_alpha_ = 0.0f;
        request_repaint();
    });
}

void CircleProgress::start_fade(IconPtr next) {
    if (is_fading()) {
        spdlog::debug("[CircleProgress] Fade to '{}' interrupted, promoting it",
                      next_icon_ ? next_icon_->source : std::string("?"));
        cancel_fade(true);
    }

    next_icon_ = std::move(next);
    fade_alpha_ = 0.0f;
    uint32_t serial = ++fade_serial_;

    spdlog::debug("[CircleProgress] Cross-fading to '{}'", next_icon_->source);

    AnimSpec spec;
    spec.from = 0.0f;
    spec.to = 1.0f;
    spec.duration_ms = ICON_FADE_DURATION_MS;
    spec.easing = Easing::LINEAR;

    AnimId id = driver_.start(
        spec, [this, serial](const AnimEvent& event) { handle_fade_event(serial, event); });
    if (serial == fade_serial_ && id != NO_ANIM) {
        fade_anim_ = id;
    }
}

void CircleProgress::handle_fade_event(uint32_t serial, const AnimEvent& event) {
    switch (event.type) {
    case AnimEventType::UPDATED:
        fade_alpha_ = std::clamp(event.value, 0.0f, 1.0f);
        request_repaint();
        break;

    case AnimEventType::ENDED:
        if (serial == fade_serial_) {
            fade_anim_ = NO_ANIM;
        }
        if (next_icon_) {
            icon_ = std::move(next_icon_);
            next_icon_.reset();
        }
        fade_alpha_ = 0.0f;
        spdlog::debug("[CircleProgress] Cross-fade done, icon is '{}'",
                      icon_ ? icon_->source : std::string());
        request_repaint();
        break;

    case AnimEventType::STARTED:
    case AnimEventType::CANCELLED:
        break;
    }
}

void CircleProgress::cancel_fade(bool promote_next) {
    AnimId id = std::exchange(fade_anim_, NO_ANIM);
    if (id != NO_ANIM) {
        driver_.cancel(id);
    }
    if (promote_next && next_icon_) {
        icon_ = std::move(next_icon_);
        next_icon_.reset();
    }
    fade_alpha_ = 0.0f;
}

// ============================================================================
// Rendering
// ============================================================================

void CircleProgress::draw(RenderSurface& surface) const {
    int32_t width = surface.width();
    int32_t height = surface.height();
    if (width <= 0 || height <= 0) {
        spdlog::trace("[CircleProgress] Skipping draw on {}x{} surface", width, height);
        return;
    }

    CircleGeometry geo = compute_circle_geometry(width, height, style_);

    surface.draw_shadow_circle(geo.cx, geo.cy, geo.radius, style_.shadow_radius,
                               style_.shadow_color, style_.shadow_opa);
    surface.fill_circle(geo.cx, geo.cy, geo.radius, style_.circle_color);

    float sweep = sweep_angle();
    if (sweep != 0.0f) {
        surface.stroke_arc(geo.arc_rect, style_.start_angle, sweep, style_.border_width,
                           style_.border_color);
    }

    if (icon_) {
        auto opa = static_cast<uint8_t>(255 * (1.0f - fade_alpha_));
        surface.draw_image(*icon_, (width - icon_->width) / 2, (height - icon_->height) / 2, opa);
    }

    if (next_icon_) {
        auto opa = static_cast<uint8_t>(255 * fade_alpha_);
        surface.draw_image(*next_icon_, (width - next_icon_->width) / 2,
                           (height - next_icon_->height) / 2, opa);
    }

    spdlog::trace("[CircleProgress] Draw: {}x{}, progress={:.3f}, sweep={:.1f}, fade={:.2f}",
                  width, height, current_progress_, sweep, fade_alpha_);
}

} // namespace halo
