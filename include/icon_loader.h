// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file icon_loader.h
 * @brief Resolves icon resource handles to decoded rasters
 *
 * A resource handle is a string: either a name registered with the loader
 * or an LVGL image path ("A:icons/check.png"). Loading is synchronous and
 * expected to be cheap (decoded headers are cached by the loader).
 */

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace halo {

/**
 * @brief Thrown when a resource handle cannot be resolved or decoded
 */
class ResourceNotFound : public std::runtime_error {
  public:
    explicit ResourceNotFound(const std::string& resource)
        : std::runtime_error("Icon resource not found: " + resource), resource_(resource) {}

    const std::string& resource() const {
        return resource_;
    }

  private:
    std::string resource_;
};

struct IconImage {
    std::string source; ///< Handle the image was loaded from
    int32_t width = 0;
    int32_t height = 0;

    /// Backend image source (e.g. lv_image_dsc_t*); nullptr means use @c source as a path
    const void* image_src = nullptr;
};

using IconPtr = std::shared_ptr<const IconImage>;

class IconLoader {
  public:
    virtual ~IconLoader() = default;

    /**
     * @brief Load the icon behind @p resource
     * @throws ResourceNotFound if the handle is unknown or fails to decode
     */
    virtual IconPtr load(const std::string& resource) = 0;
};

} // namespace halo
