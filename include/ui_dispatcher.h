// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file ui_dispatcher.h
 * @brief Marshals work onto the single UI (LVGL) thread
 *
 * LVGL is not thread-safe. Anything that touches widget state or requests a
 * repaint must run on the thread that calls lv_timer_handler(). Public
 * widget mutators call run_on_ui(), which runs inline on the UI thread and
 * queues the work otherwise.
 *
 * @code
 * // From a download/worker thread:
 * dispatcher.run_on_ui([progress]() { widget.animate_progress(progress); });
 * @endcode
 */

#include <functional>
#include <utility>

namespace halo {

class UiDispatcher {
  public:
    using Work = std::function<void()>;

    virtual ~UiDispatcher() = default;

    /// True when called from the UI thread
    virtual bool is_ui_thread() const = 0;

    /// Queue @p work for the UI thread (never runs inline)
    virtual void post(Work work) = 0;

    /// Run @p work now if on the UI thread, else post() it
    void run_on_ui(Work work) {
        if (is_ui_thread()) {
            work();
        } else {
            post(std::move(work));
        }
    }
};

} // namespace halo
