// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "lvgl/lvgl.h"

#include <cstdint>
#include <string>

/**
 * @brief Manages LVGL display initialization and lifecycle
 *
 * Initializes LVGL and creates the display plus an optional pointer input.
 * Desktop builds (HALO_DISPLAY_SDL) open an SDL window; other builds drive
 * the Linux framebuffer with evdev touch input.
 *
 * @code
 * DisplayManager display_mgr;
 * DisplayManager::Config config;
 * config.width = 480;
 * config.height = 480;
 *
 * if (!display_mgr.init(config)) {
 *     spdlog::error("Failed to initialize display");
 *     return 1;
 * }
 * @endcode
 *
 * Thread safety: All methods should be called from the main thread.
 */
class DisplayManager {
  public:
    struct Config {
        int width = 480;                        ///< Display width in pixels
        int height = 480;                       ///< Display height in pixels
        std::string fb_device = "/dev/fb0";     ///< Framebuffer builds only
        std::string touch_device;               ///< Empty = no pointer input (framebuffer builds)
    };

    DisplayManager();
    ~DisplayManager();

    DisplayManager(const DisplayManager&) = delete;
    DisplayManager& operator=(const DisplayManager&) = delete;
    DisplayManager(DisplayManager&&) = delete;
    DisplayManager& operator=(DisplayManager&&) = delete;

    /**
     * @brief Initialize LVGL, the display and input
     * @return true on success, false on failure (logs error details)
     */
    bool init(const Config& config);

    /**
     * @brief Shutdown display and release resources
     *
     * Safe to call multiple times. Called automatically by destructor.
     */
    void shutdown();

    bool is_initialized() const {
        return m_initialized;
    }

    lv_display_t* display() const {
        return m_display;
    }

    lv_indev_t* pointer_input() const {
        return m_pointer;
    }

    int width() const {
        return m_width;
    }

    int height() const {
        return m_height;
    }

    /// Milliseconds since some fixed point (wraps at ~49 days)
    static uint32_t get_ticks();

    static void delay(uint32_t ms);

  private:
    bool m_initialized = false;
    int m_width = 0;
    int m_height = 0;

    lv_display_t* m_display = nullptr;
    lv_indev_t* m_pointer = nullptr;
};
