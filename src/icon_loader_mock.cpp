// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "icon_loader_mock.h"

#include <spdlog/spdlog.h>

namespace halo {

IconPtr IconLoaderMock::load(const std::string& resource) {
    load_count_++;
    auto it = icons_.find(resource);
    if (it == icons_.end()) {
        spdlog::warn("[IconLoaderMock] Unknown icon '{}'", resource);
        throw ResourceNotFound(resource);
    }
    return it->second;
}

void IconLoaderMock::add_icon(const std::string& resource, int32_t width, int32_t height) {
    auto icon = std::make_shared<IconImage>();
    icon->source = resource;
    icon->width = width;
    icon->height = height;
    icons_[resource] = icon;
}

} // namespace halo
