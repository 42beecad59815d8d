// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file display_manager.cpp
 * @brief LVGL display and input device lifecycle management
 *
 * @threading Main thread only
 * @gotchas NEVER call lv_display_delete manually - lv_deinit() handles all cleanup
 *
 * @see application.cpp
 */

#include "display_manager.h"

#include <spdlog/spdlog.h>

#ifdef HALO_DISPLAY_SDL
#include <SDL.h>
#else
#include <time.h>
#endif

DisplayManager::DisplayManager() = default;

DisplayManager::~DisplayManager() {
    shutdown();
}

bool DisplayManager::init(const Config& config) {
    if (m_initialized) {
        spdlog::warn("[DisplayManager] Already initialized, call shutdown() first");
        return false;
    }

    if (config.width <= 0 || config.height <= 0) {
        spdlog::error("[DisplayManager] Invalid display size {}x{}", config.width, config.height);
        return false;
    }

    m_width = config.width;
    m_height = config.height;

    lv_init();
    lv_tick_set_cb(get_ticks);

#ifdef HALO_DISPLAY_SDL
    spdlog::info("[DisplayManager] Using backend: SDL");
    m_display = lv_sdl_window_create(m_width, m_height);
    if (!m_display) {
        spdlog::error("[DisplayManager] Failed to create SDL window");
        lv_deinit();
        return false;
    }
    lv_sdl_window_set_title(m_display, "halo-demo");

    m_pointer = lv_sdl_mouse_create();
    if (!m_pointer) {
        // Mouse is optional on desktop
        spdlog::warn("[DisplayManager] No pointer input device created - mouse disabled");
    }
#else
    spdlog::info("[DisplayManager] Using backend: framebuffer on {}", config.fb_device);
    m_display = lv_linux_fbdev_create();
    if (!m_display) {
        spdlog::error("[DisplayManager] Failed to create framebuffer display");
        lv_deinit();
        return false;
    }
    lv_linux_fbdev_set_file(m_display, config.fb_device.c_str());

    if (!config.touch_device.empty()) {
        m_pointer = lv_evdev_create(LV_INDEV_TYPE_POINTER, config.touch_device.c_str());
        if (!m_pointer) {
            spdlog::warn("[DisplayManager] Failed to open touch input on {}",
                         config.touch_device);
        }
    }
#endif

    spdlog::debug("[DisplayManager] Initialized: {}x{}", m_width, m_height);
    m_initialized = true;
    return true;
}

void DisplayManager::shutdown() {
    if (!m_initialized) {
        return;
    }

    spdlog::debug("[DisplayManager] Shutting down");

    // lv_deinit() deletes all displays and input devices
    m_pointer = nullptr;
    m_display = nullptr;

    lv_deinit();

    m_width = 0;
    m_height = 0;
    m_initialized = false;
}

// ============================================================================
// Static Timing Functions
// ============================================================================

uint32_t DisplayManager::get_ticks() {
#ifdef HALO_DISPLAY_SDL
    return SDL_GetTicks();
#else
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint32_t>(ts.tv_sec * 1000 + ts.tv_nsec / 1000000);
#endif
}

void DisplayManager::delay(uint32_t ms) {
#ifdef HALO_DISPLAY_SDL
    SDL_Delay(ms);
#else
    struct timespec ts = {static_cast<time_t>(ms / 1000),
                          static_cast<long>((ms % 1000) * 1000000L)};
    nanosleep(&ts, nullptr);
#endif
}
