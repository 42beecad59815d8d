// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "circle_progress_types.h"
#include "config.h"

#include <string>

/**
 * @file circle_progress_config.h
 * @brief Text parsing and config loading for CircleProgressStyle
 *
 * Shared by the config file loader and the XML attribute parser.
 *
 * Config layout (all keys optional):
 * @code{.json}
 * "circle_progress": {
 *   "border_width": 10, "border_color": "#2196F3", "circle_color": "0xFFFFFF",
 *   "shadow_radius": 20, "increment_duration_ms": 500,
 *   "start_angle": "top", "clockwise": true
 * }
 * @endcode
 */

namespace halo {

/// Parse "0xRRGGBB", "#RRGGBB" or a decimal integer
bool parse_color(const std::string& text, uint32_t& out);

/// Parse "top"/"right"/"bottom"/"left" (any case) or a number of degrees
bool parse_start_angle(const std::string& text, float& out);

/// Parse "true"/"false"/"1"/"0"
bool parse_bool(const std::string& text, bool& out);

/**
 * @brief Build a style from @p config, keeping defaults for missing or invalid keys
 * @param prefix JSON pointer of the style object
 */
CircleProgressStyle load_circle_progress_style(const Config& config,
                                               const std::string& prefix = "/circle_progress");

} // namespace halo
