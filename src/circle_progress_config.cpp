// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "circle_progress_config.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace halo {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Color stored either as a number or a string
bool read_color(const Config& config, const std::string& key, uint32_t& out) {
    json value = config.get<json>(key, json());
    if (value.is_number_unsigned() || value.is_number_integer()) {
        out = value.get<uint32_t>() & 0xFFFFFF;
        return true;
    }
    if (value.is_string()) {
        if (parse_color(value.get<std::string>(), out)) {
            return true;
        }
        spdlog::warn("[Config] Invalid color '{}' at {}", value.get<std::string>(), key);
    }
    return false;
}

} // namespace

bool parse_color(const std::string& text, uint32_t& out) {
    if (text.empty()) {
        return false;
    }

    const char* begin = text.c_str();
    int base = 10;
    if (text[0] == '#') {
        begin += 1;
        base = 16;
    } else if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        begin += 2;
        base = 16;
    }

    // strtoul would also accept whitespace, a sign or a second 0x prefix
    unsigned char first = static_cast<unsigned char>(*begin);
    if (base == 16 ? !std::isxdigit(first) : !std::isdigit(first)) {
        return false;
    }

    char* end = nullptr;
    unsigned long value = std::strtoul(begin, &end, base);
    if (*end != '\0' || value > 0xFFFFFF) {
        return false;
    }

    out = static_cast<uint32_t>(value);
    return true;
}

bool parse_start_angle(const std::string& text, float& out) {
    std::string name = to_lower(text);
    if (name == "top") {
        out = start_angle::TOP;
    } else if (name == "right") {
        out = start_angle::RIGHT;
    } else if (name == "bottom") {
        out = start_angle::BOTTOM;
    } else if (name == "left") {
        out = start_angle::LEFT;
    } else {
        if (text.empty()) {
            return false;
        }
        char* end = nullptr;
        float value = std::strtof(text.c_str(), &end);
        if (*end != '\0') {
            return false;
        }
        out = value;
    }
    return true;
}

bool parse_bool(const std::string& text, bool& out) {
    std::string value = to_lower(text);
    if (value == "true" || value == "1") {
        out = true;
    } else if (value == "false" || value == "0") {
        out = false;
    } else {
        return false;
    }
    return true;
}

CircleProgressStyle load_circle_progress_style(const Config& config, const std::string& prefix) {
    CircleProgressStyle style;

    style.border_width = std::max(0, config.get<int>(prefix + "/border_width", style.border_width));
    style.shadow_radius =
        std::max(0, config.get<int>(prefix + "/shadow_radius", style.shadow_radius));
    style.increment_duration_ms = std::max(
        0, config.get<int>(prefix + "/increment_duration_ms", style.increment_duration_ms));

    read_color(config, prefix + "/border_color", style.border_color);
    read_color(config, prefix + "/circle_color", style.circle_color);
    read_color(config, prefix + "/shadow_color", style.shadow_color);
    style.shadow_opa = static_cast<uint8_t>(
        std::clamp(config.get<int>(prefix + "/shadow_opa", style.shadow_opa), 0, 255));

    json angle = config.get<json>(prefix + "/start_angle", json());
    if (angle.is_number()) {
        style.start_angle = angle.get<float>();
    } else if (angle.is_string() && !parse_start_angle(angle.get<std::string>(), style.start_angle)) {
        spdlog::warn("[Config] Invalid start_angle '{}', using top", angle.get<std::string>());
    }

    bool clockwise = config.get<bool>(prefix + "/clockwise", true);
    style.rotation = clockwise ? Rotation::CLOCKWISE : Rotation::COUNTER_CLOCKWISE;

    spdlog::debug("[Config] circle_progress style: border={}px #{:06X}, circle #{:06X}, "
                  "shadow={}px, {}ms, start={}, {}",
                  style.border_width, style.border_color, style.circle_color, style.shadow_radius,
                  style.increment_duration_ms, style.start_angle,
                  clockwise ? "clockwise" : "counter-clockwise");
    return style;
}

} // namespace halo
