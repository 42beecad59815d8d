// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file application.cpp
 * @brief halo-demo startup, main loop and shutdown
 *
 * @pattern Startup sequence: config -> logging -> display -> widget -> worker
 * @threading LVGL on the main thread; the progress worker only uses the thread-safe API
 * @gotchas Stop the worker before deleting the widget, and delete the widget before lv_deinit()
 */

#include "application.h"

#include "circle_progress_config.h"
#include "config.h"
#include "ui_circle_progress.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace {

std::atomic<bool> g_quit_requested{false};

void handle_signal(int /*signum*/) {
    g_quit_requested = true;
}

void print_usage(const char* prog) {
    std::printf("Usage: %s [options]\n"
                "  --config FILE   Config file (default: halo.json)\n"
                "  --size WxH      Display size, overrides /display/width and /display/height\n"
                "  -v, -vv, -vvv   Log level info, debug, trace\n"
                "  -h, --help      Show this help\n",
                prog);
}

} // namespace

Application::~Application() {
    shutdown();
}

bool Application::parse_args(int argc, char** argv, Args& args) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
        } else if (strcmp(arg, "--config") == 0) {
            if (i + 1 >= argc) {
                spdlog::error("[Application] --config needs a file argument");
                return false;
            }
            args.config_path = argv[++i];
        } else if (strcmp(arg, "--size") == 0) {
            if (i + 1 >= argc) {
                spdlog::error("[Application] --size needs a WxH argument");
                return false;
            }
            int w = 0;
            int h = 0;
            if (std::sscanf(argv[++i], "%dx%d", &w, &h) != 2 || w <= 0 || h <= 0) {
                spdlog::error("[Application] Invalid size '{}', expected WxH", argv[i]);
                return false;
            }
            args.width = w;
            args.height = h;
        } else if (arg[0] == '-' && arg[1] == 'v') {
            // -v, -vv, -vvv
            const char* p = arg + 1;
            while (*p == 'v') {
                ++p;
            }
            if (*p != '\0') {
                spdlog::error("[Application] Unknown option '{}'", arg);
                return false;
            }
            args.verbosity = static_cast<int>(p - (arg + 1));
        } else {
            spdlog::error("[Application] Unknown option '{}'", arg);
            return false;
        }
    }
    return true;
}

spdlog::level::level_enum Application::resolve_log_level(int verbosity,
                                                         const std::string& config_level) {
    switch (verbosity) {
    case 0:
        break;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return spdlog::level::trace;
    }

    spdlog::level::level_enum level = spdlog::level::from_str(config_level);
    // from_str maps unknown names to "off"; only honor an explicit "off"
    if (level == spdlog::level::off && config_level != "off") {
        return spdlog::level::info;
    }
    return level;
}

int Application::run(int argc, char** argv) {
    if (!parse_args(argc, argv, m_args)) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (m_args.show_help) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    Config* config = Config::get_instance();
    if (!config->load(m_args.config_path)) {
        spdlog::warn("[Application] Using default configuration");
    }

    spdlog::set_level(
        resolve_log_level(m_args.verbosity, config->get<std::string>("/log_level", "info")));
    spdlog::info("[Application] halo-demo starting");

    m_step = config->get<float>("/demo/step", 0.25f);
    if (m_step <= 0.0f) {
        spdlog::warn("[Application] /demo/step must be positive, using 0.25");
        m_step = 0.25f;
    }
    m_step_interval_ms = std::max(1, config->get<int>("/demo/step_interval_ms", 1500));
    m_icons = config->get<std::vector<std::string>>("/demo/icons", {});

    if (!init_display()) {
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    create_ui();
    start_worker();
    main_loop();
    shutdown();

    spdlog::info("[Application] Exiting");
    return EXIT_SUCCESS;
}

bool Application::init_display() {
    Config* config = Config::get_instance();

    DisplayManager::Config display_config;
    display_config.width = m_args.width > 0 ? m_args.width
                                            : config->get<int>("/display/width", 480);
    display_config.height = m_args.height > 0 ? m_args.height
                                              : config->get<int>("/display/height", 480);
    display_config.fb_device =
        config->get<std::string>("/display/fb_device", display_config.fb_device);
    display_config.touch_device = config->get<std::string>("/display/touch_device", "");

    if (!m_display.init(display_config)) {
        spdlog::error("[Application] Display initialization failed");
        return false;
    }
    return true;
}

void Application::create_ui() {
    ui_circle_progress_set_default_style(
        halo::load_circle_progress_style(*Config::get_instance()));
    ui_circle_progress_register();

    lv_obj_t* screen = lv_screen_active();
    lv_obj_set_style_bg_color(screen, lv_color_hex(0xECEFF1), 0);

    int32_t size = std::min(m_display.width(), m_display.height()) * 2 / 3;
    m_progress = ui_circle_progress_create(screen);
    if (!m_progress) {
        return;
    }
    lv_obj_set_size(m_progress, size, size);
    lv_obj_center(m_progress);
    ui_circle_progress_set_complete_callback(m_progress, complete_cb, this);

    if (!m_icons.empty() && !ui_circle_progress_set_icon(m_progress, m_icons[0].c_str())) {
        spdlog::warn("[Application] First icon '{}' unavailable", m_icons[0]);
    }

    spdlog::info("[Application] Widget {}x{}, step {} every {}ms, {} icons", size, size, m_step,
                 m_step_interval_ms, m_icons.size());
}

void Application::start_worker() {
    if (!m_progress) {
        return;
    }

    m_running = true;
    m_worker = std::thread([this]() {
        float value = 0.0f;
        while (m_running) {
            // Sleep in short slices so shutdown is not held up by a long interval
            auto wake = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(m_step_interval_ms);
            while (m_running && std::chrono::steady_clock::now() < wake) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
            if (!m_running) {
                break;
            }

            if (value >= 1.0f) {
                value = 0.0f;
                ui_circle_progress_reset(m_progress);
                spdlog::debug("[Application] Job restarted");
                continue;
            }

            value = std::min(1.0f, value + m_step);
            spdlog::debug("[Application] Job progress {:.2f}", value);
            ui_circle_progress_animate(m_progress, value);
        }
    });
}

void Application::stop_worker() {
    m_running = false;
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void Application::main_loop() {
    while (!g_quit_requested && lv_display_get_default() != nullptr) {
        uint32_t idle_ms = lv_timer_handler();
        DisplayManager::delay(std::min<uint32_t>(idle_ms, 5));
    }
    spdlog::info("[Application] Main loop finished");
}

void Application::shutdown() {
    stop_worker();

    if (m_progress) {
        lv_obj_delete(m_progress);
        m_progress = nullptr;
    }
    if (m_display.is_initialized()) {
        ui_circle_progress_shutdown();
        m_display.shutdown();
    }
}

void Application::on_progress_complete() {
    spdlog::info("[Application] Job complete");
    if (m_icons.size() < 2) {
        return;
    }

    m_icon_index = (m_icon_index + 1) % m_icons.size();
    if (!ui_circle_progress_animate_icon(m_progress, m_icons[m_icon_index].c_str())) {
        spdlog::warn("[Application] Skipping icon '{}'", m_icons[m_icon_index]);
    }
}

void Application::complete_cb(lv_obj_t* /*obj*/, void* user_data) {
    static_cast<Application*>(user_data)->on_progress_complete();
}
