// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "circle_progress.h"
#include "lvgl_dispatcher.h"
#include "lvgl_icon_loader.h"

#include "lvgl/lvgl.h"

/**
 * @file ui_circle_progress.h
 * @brief LVGL object wrapper for halo::CircleProgress
 *
 * Creates a transparent lv_obj that renders a CircleProgress in its
 * LV_EVENT_DRAW_MAIN handler. All instances share one animation driver,
 * dispatcher and icon loader, created by ui_circle_progress_register() or
 * the first ui_circle_progress_create() (both on the LVGL thread).
 *
 * XML usage:
 * @code{.xml}
 * <circle_progress width="200" height="200" progress="0.75" start_angle="top"
 *                  clockwise="true" border_width="10" border_color="0x2196F3"
 *                  circle_color="0xFFFFFF" shadow_radius="20" duration="500"
 *                  icon="A:icons/download.png"/>
 * @endcode
 *
 * Setters may be called from any thread; calls from other threads are
 * queued and applied on the LVGL thread.
 */

/// Completion callback: invoked on the LVGL thread when progress reaches 100%
typedef void (*circle_progress_complete_cb_t)(lv_obj_t* obj, void* user_data);

/// Register the <circle_progress> XML widget and create the shared backends
void ui_circle_progress_register(void);

/// Delete any remaining widgets and release the shared backends; call before lv_deinit()
void ui_circle_progress_shutdown(void);

/**
 * @brief Create a circle progress widget programmatically
 * @param parent Parent LVGL object
 * @return Created object, or nullptr on failure
 */
lv_obj_t* ui_circle_progress_create(lv_obj_t* parent);

/// Style applied to widgets created after this call
void ui_circle_progress_set_default_style(const halo::CircleProgressStyle& style);

/// Access the core widget for C++ callers (LVGL thread only; nullptr if not a circle_progress)
halo::CircleProgress* ui_circle_progress_get(lv_obj_t* obj);

/// Shared loader, e.g. to register compiled-in images
halo::ui::LvglIconLoader* ui_circle_progress_icon_loader(void);

/// Shared dispatcher for worker threads
halo::ui::LvglDispatcher* ui_circle_progress_dispatcher(void);

void ui_circle_progress_animate(lv_obj_t* obj, float progress);
void ui_circle_progress_reset(lv_obj_t* obj);

void ui_circle_progress_set_duration(lv_obj_t* obj, int duration_ms);
void ui_circle_progress_set_start_angle(lv_obj_t* obj, float degrees);
void ui_circle_progress_set_clockwise(lv_obj_t* obj, bool clockwise);
void ui_circle_progress_set_border_width(lv_obj_t* obj, int width);
void ui_circle_progress_set_border_color(lv_obj_t* obj, lv_color_t color);
void ui_circle_progress_set_circle_color(lv_obj_t* obj, lv_color_t color);
void ui_circle_progress_set_shadow_radius(lv_obj_t* obj, int radius);
void ui_circle_progress_set_complete_callback(lv_obj_t* obj, circle_progress_complete_cb_t cb,
                                              void* user_data);

/**
 * @brief Show an icon immediately
 * @return false if the icon could not be loaded (LVGL thread) or @p obj is invalid
 */
bool ui_circle_progress_set_icon(lv_obj_t* obj, const char* resource);

/**
 * @brief Cross-fade to a new icon
 * @return false if the icon could not be loaded (LVGL thread) or @p obj is invalid
 */
bool ui_circle_progress_animate_icon(lv_obj_t* obj, const char* resource);

float ui_circle_progress_get_progress(lv_obj_t* obj);
bool ui_circle_progress_is_animating(lv_obj_t* obj);

/// Stop progress and icon animations, leaving the current frame as is
void ui_circle_progress_stop_animations(lv_obj_t* obj);
