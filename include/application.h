// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "display_manager.h"

#include "lvgl/lvgl.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

/**
 * @file application.h
 * @brief halo-demo: one circle_progress widget fed by a simulated job
 *
 * A worker thread advances progress by /demo/step every
 * /demo/step_interval_ms and hands each value to the widget through the
 * thread-safe C API. Each completion cross-fades to the next icon in
 * /demo/icons; the step after a completion resets the widget to zero.
 *
 * Usage: halo-demo [--config FILE] [--size WxH] [-v|-vv|-vvv]
 */
class Application {
  public:
    struct Args {
        std::string config_path = "halo.json";
        int width = 0;  ///< 0 = take from config
        int height = 0; ///< 0 = take from config
        int verbosity = 0;
        bool show_help = false;
    };

    Application() = default;
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /// @return process exit code
    int run(int argc, char** argv);

    /**
     * @brief Parse command line arguments
     * @return false on a malformed argument (error already logged)
     */
    static bool parse_args(int argc, char** argv, Args& args);

    /// spdlog level for @p verbosity -v flags, falling back to @p config_level
    static spdlog::level::level_enum resolve_log_level(int verbosity,
                                                       const std::string& config_level);

  private:
    bool init_display();
    void create_ui();
    void start_worker();
    void stop_worker();
    void main_loop();
    void shutdown();

    void on_progress_complete();

    static void complete_cb(lv_obj_t* obj, void* user_data);

    Args m_args;
    DisplayManager m_display;
    lv_obj_t* m_progress = nullptr;

    float m_step = 0.25f;
    int m_step_interval_ms = 1500;
    std::vector<std::string> m_icons;
    size_t m_icon_index = 0;

    std::thread m_worker;
    std::atomic<bool> m_running{false};
};
