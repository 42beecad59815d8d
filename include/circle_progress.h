// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "animation_driver.h"
#include "circle_progress_types.h"
#include "icon_loader.h"
#include "render_surface.h"
#include "ui_dispatcher.h"

#include <functional>
#include <memory>
#include <string>

/**
 * @file circle_progress.h
 * @brief Circular progress indicator: state machine, renderer, icon cross-fade
 *
 * Draws a filled circle with a drop shadow and an arc on its border whose
 * sweep is the completion percentage (0 = no arc, 1 = full ring). An optional
 * icon sits in the middle and can cross-fade to a new one.
 *
 * The class is backend-agnostic. It drives animations through an
 * AnimationDriver, marshals mutations through a UiDispatcher, resolves icons
 * through an IconLoader and renders onto a RenderSurface. The LVGL object
 * wrapper lives in ui_circle_progress.h.
 *
 * @code
 * halo::CircleProgress progress(driver, dispatcher, loader, [obj]() { lv_obj_invalidate(obj); });
 * progress.set_on_complete([]() { spdlog::info("Done"); });
 * progress.animate_progress(0.75f);
 * @endcode
 *
 * @threading Mutators may be called from any thread; they are re-dispatched to
 *            the UI thread. Queries and draw() are UI thread only.
 */

namespace halo {

/**
 * @brief Layout of one frame, derived from the surface size and style
 */
struct CircleGeometry {
    int32_t cx = 0;
    int32_t cy = 0;
    int32_t radius = 0;   ///< Radius of the shadow and fill circles
    SurfaceRect arc_rect; ///< Bounds the progress arc is inscribed in
};

CircleGeometry compute_circle_geometry(int32_t width, int32_t height,
                                       const CircleProgressStyle& style);

class CircleProgress {
  public:
    using CompleteCallback = std::function<void()>;
    using RepaintCallback = std::function<void()>;

    CircleProgress(AnimationDriver& driver, UiDispatcher& dispatcher, IconLoader& loader,
                   RepaintCallback repaint = nullptr);
    ~CircleProgress();

    CircleProgress(const CircleProgress&) = delete;
    CircleProgress& operator=(const CircleProgress&) = delete;

    // ========================================================================
    // Configuration
    // ========================================================================

    /// Duration in milliseconds of each animate_progress() transition
    void set_increment_duration(int duration_ms);

    /// Arc start in degrees (see halo::start_angle)
    void set_start_angle(float degrees);

    /// Invoked once each time a progress animation ends at 100%
    void set_on_complete(CompleteCallback callback);

    void set_border_width(int width);
    void set_border_color(uint32_t color);
    void set_circle_color(uint32_t color);
    void set_shadow_radius(int radius);
    void set_rotation_clockwise(bool clockwise);

    /// Replace all static visual parameters at once
    void apply_style(const CircleProgressStyle& style);

    /// Called on the UI thread whenever a new frame is needed
    void set_repaint_callback(RepaintCallback repaint);

    // ========================================================================
    // Progress
    // ========================================================================

    /**
     * @brief Animate the arc to @p value
     *
     * Values are clamped to [0,1]. Requesting the value the widget is already
     * heading to does nothing. A request during an animation supersedes it
     * and continues from the currently displayed progress.
     */
    void animate_progress(float value);

    /// Jump back to 0 and stop any running progress animation
    void reset();

    /**
     * @brief Freeze the progress arc where it is and finish any icon fade
     *
     * The displayed progress becomes the target, so animating to the old
     * destination afterwards starts a new tween.
     */
    void stop_animations();

    // ========================================================================
    // Icons
    // ========================================================================

    /**
     * @brief Show @p resource in the center immediately
     * @throws ResourceNotFound when called on the UI thread with a bad handle
     */
    void set_icon(const std::string& resource);

    /**
     * @brief Cross-fade from the current icon to @p resource over 500ms
     *
     * A call while a fade is running promotes the incoming icon of that fade
     * and starts a new fade from it.
     *
     * @throws ResourceNotFound when called on the UI thread with a bad handle
     */
    void animate_next_image(const std::string& resource);

    /// Remove both icons and stop any fade
    void clear_icon();

    // ========================================================================
    // Rendering and state (UI thread)
    // ========================================================================

    /// Render one frame. Does not modify state.
    void draw(RenderSurface& surface) const;

    float progress() const {
        return current_progress_;
    }

    float target_progress() const {
        return target_progress_;
    }

    /// Signed arc extent in degrees for the current frame
    float sweep_angle() const;

    bool is_animating() const {
        return progress_anim_ != NO_ANIM;
    }

    bool is_fading() const {
        return fade_anim_ != NO_ANIM;
    }

    float fade_alpha() const {
        return fade_alpha_;
    }

    const IconPtr& icon() const {
        return icon_;
    }

    const IconPtr& next_icon() const {
        return next_icon_;
    }

    const CircleProgressStyle& style() const {
        return style_;
    }

  private:
    /// Run @p work on the UI thread; @p op names the caller for logging
    void mutate(const char* op, UiDispatcher::Work work);

    void start_progress_tween(float to);
    void handle_progress_event(uint32_t serial, float to, const AnimEvent& event);
    void cancel_progress_tween();

    void start_fade(IconPtr next);
    void handle_fade_event(uint32_t serial, const AnimEvent& event);
    void cancel_fade(bool promote_next);

    void request_repaint();

    AnimationDriver& driver_;
    UiDispatcher& dispatcher_;
    IconLoader& loader_;
    RepaintCallback repaint_;

    CircleProgressStyle style_;
    CompleteCallback on_complete_;

    // Progress state
    float current_progress_ = 0.0f;
    float target_progress_ = 0.0f;
    AnimId progress_anim_ = NO_ANIM;
    uint32_t progress_serial_ = 0;
    float progress_anim_to_ = 0.0f;   ///< Destination of the running tween
    float superseding_target_ = 0.0f; ///< Written to target_progress_ on cancel

    // Icon state
    IconPtr icon_;
    IconPtr next_icon_;
    float fade_alpha_ = 0.0f;
    AnimId fade_anim_ = NO_ANIM;
    uint32_t fade_serial_ = 0;

    /// Expires on destruction so queued work for this widget is dropped
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace halo
