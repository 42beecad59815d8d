// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "icon_loader.h"

#include "lvgl/lvgl.h"

#include <string>
#include <unordered_map>

/**
 * @file lvgl_icon_loader.h
 * @brief IconLoader resolving names and paths through the LVGL image decoder
 *
 * Resolution order for a handle:
 * 1. Names added with register_image() (compiled-in lv_image_dsc_t assets)
 * 2. Filesystem paths; a missing drive letter gets the default "A:" prefix
 *
 * The decoder is only asked for the image header (size); pixels are decoded
 * by the draw pipeline. Results are cached per handle.
 *
 * @threading UI thread only (LVGL decoders are not thread-safe)
 */

namespace halo::ui {

class LvglIconLoader : public IconLoader {
  public:
    IconPtr load(const std::string& resource) override;

    /// Make a compiled-in image loadable by @p name (image must outlive the loader)
    void register_image(const std::string& name, const lv_image_dsc_t* image);

    /// Drop cached headers, e.g. after icon files changed on disk
    void clear_cache();

    /// Turn "icons/a.png" into "A:icons/a.png"; paths with a drive letter are kept
    static std::string to_lvgl_path(const std::string& path);

  private:
    std::unordered_map<std::string, const lv_image_dsc_t*> registered_;
    std::unordered_map<std::string, IconPtr> cache_;
};

} // namespace halo::ui
