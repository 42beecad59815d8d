// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <filesystem>
#include <fstream>

static Config g_config;

Config::Config() : data(default_config()) {}

Config* Config::get_instance() {
    return &g_config;
}

json Config::default_config() {
    return {
        {"log_level", "info"},
        {"display", {{"width", 480}, {"height", 480}}},
        {"circle_progress",
         {{"border_width", 10},
          {"border_color", "0x0000FF"},
          {"circle_color", "0xFFFFFF"},
          {"shadow_radius", 20},
          {"increment_duration_ms", 500},
          {"start_angle", "top"},
          {"clockwise", true}}},
        {"demo", {{"step", 0.25}, {"step_interval_ms", 1500}, {"icons", json::array()}}},
    };
}

bool Config::load(const std::string& path) {
    path_ = path;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::info("[Config] {} not found, writing defaults", path);
        data = default_config();
        save();
        return true;
    }

    std::ifstream in(path);
    if (!in) {
        spdlog::error("[Config] Cannot open {}", path);
        return false;
    }

    try {
        json loaded = json::parse(in);
        // Merge over defaults so new keys get values on old config files
        json merged = default_config();
        merged.merge_patch(loaded);
        data = std::move(merged);
    } catch (const json::parse_error& e) {
        spdlog::error("[Config] Parse error in {}: {}", path, e.what());
        return false;
    }

    spdlog::info("[Config] Loaded {}", path);
    return true;
}

bool Config::save() const {
    std::ofstream out(path_);
    if (!out) {
        spdlog::error("[Config] Cannot write {}", path_);
        return false;
    }
    out << data.dump(2) << std::endl;
    spdlog::debug("[Config] Saved {}", path_);
    return true;
}

bool Config::contains(const std::string& json_ptr) const {
    try {
        return data.contains(json::json_pointer(json_ptr));
    } catch (const json::exception&) {
        return false; // Malformed pointer can't name an existing key
    }
}
