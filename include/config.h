// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>

using json = nlohmann::json;

/**
 * @file config.h
 * @brief JSON configuration file with JSON-pointer access
 *
 * Values are addressed by JSON pointer ("/display/width"). Reads never
 * throw: a missing key, null value or type mismatch returns the default.
 *
 * @code
 * Config* cfg = Config::get_instance();
 * cfg->load("halo.json");
 * int width = cfg->get<int>("/display/width", 480);
 * cfg->set<std::string>("/log_level", "debug");
 * cfg->save();
 * @endcode
 *
 * @threading Load/save on the main thread; concurrent reads are safe
 */
class Config {
  public:
    static constexpr const char* DEFAULT_PATH = "halo.json";

    Config();

    static Config* get_instance();

    /**
     * @brief Load @p path, or write the defaults there if it does not exist
     * @return false if the file exists but cannot be parsed (defaults kept)
     */
    bool load(const std::string& path);

    /// Write the current data back to the loaded path
    bool save() const;

    template <typename T> T get(const std::string& json_ptr, const T& default_value) const {
        try {
            json::json_pointer ptr(json_ptr);
            if (!data.contains(ptr)) {
                return default_value;
            }
            const json& value = data.at(ptr);
            if (value.is_null()) {
                return default_value;
            }
            return value.get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Cannot read '{}': {}", json_ptr, e.what());
            return default_value;
        }
    }

    template <typename T> void set(const std::string& json_ptr, const T& value) {
        try {
            data[json::json_pointer(json_ptr)] = value;
        } catch (const json::exception& e) {
            spdlog::error("[Config] Cannot write '{}': {}", json_ptr, e.what());
        }
    }

    bool contains(const std::string& json_ptr) const;

    const std::string& get_path() const {
        return path_;
    }

    /// Contents written when no config file exists
    static json default_config();

  protected:
    json data;
    std::string path_ = DEFAULT_PATH;

    friend class ConfigTestFixture;
};
