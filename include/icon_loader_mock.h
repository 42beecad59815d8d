// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "icon_loader.h"

#include <map>

/**
 * @file icon_loader_mock.h
 * @brief In-memory icon loader: names map to fake rasters of a given size
 */

namespace halo {

class IconLoaderMock : public IconLoader {
  public:
    IconPtr load(const std::string& resource) override;

    /// Make @p resource loadable as a @p width x @p height raster
    void add_icon(const std::string& resource, int32_t width, int32_t height);

    int load_count() const {
        return load_count_;
    }

  private:
    std::map<std::string, IconPtr> icons_;
    int load_count_ = 0;
};

} // namespace halo
