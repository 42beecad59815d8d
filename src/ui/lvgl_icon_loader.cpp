// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_icon_loader.h"

#include <spdlog/spdlog.h>

namespace halo::ui {

std::string LvglIconLoader::to_lvgl_path(const std::string& path) {
    // LVGL drive letters are a single character followed by ':'
    if (path.size() >= 2 && path[1] == ':') {
        return path;
    }
    return "A:" + path;
}

void LvglIconLoader::register_image(const std::string& name, const lv_image_dsc_t* image) {
    if (!image) {
        spdlog::warn("[IconLoader] Ignoring null image for '{}'", name);
        return;
    }
    registered_[name] = image;
    cache_.erase(name);
    spdlog::trace("[IconLoader] Registered '{}' ({}x{})", name, image->header.w, image->header.h);
}

void LvglIconLoader::clear_cache() {
    cache_.clear();
}

IconPtr LvglIconLoader::load(const std::string& resource) {
    if (resource.empty()) {
        spdlog::error("[IconLoader] Empty icon resource");
        throw ResourceNotFound(resource);
    }

    auto cached = cache_.find(resource);
    if (cached != cache_.end()) {
        return cached->second;
    }

    auto icon = std::make_shared<IconImage>();
    lv_image_header_t header;

    auto reg = registered_.find(resource);
    if (reg != registered_.end()) {
        icon->source = resource;
        icon->image_src = reg->second;
        header = reg->second->header;
    } else {
        icon->source = to_lvgl_path(resource);
        if (lv_image_decoder_get_info(icon->source.c_str(), &header) != LV_RESULT_OK) {
            spdlog::error("[IconLoader] Cannot decode '{}'", icon->source);
            throw ResourceNotFound(resource);
        }
    }

    icon->width = static_cast<int32_t>(header.w);
    icon->height = static_cast<int32_t>(header.h);
    spdlog::debug("[IconLoader] Loaded '{}' ({}x{})", resource, icon->width, icon->height);

    cache_[resource] = icon;
    return icon;
}

} // namespace halo::ui
