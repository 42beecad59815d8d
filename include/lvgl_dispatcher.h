// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ui_dispatcher.h"

#include "lvgl/lvgl.h"

#include <mutex>
#include <thread>
#include <vector>

/**
 * @file lvgl_dispatcher.h
 * @brief UiDispatcher for the thread running lv_timer_handler()
 *
 * post() only touches a mutex-protected queue, so it is safe from any
 * thread (lv_async_call() is not). An LVGL timer drains the queue on the UI
 * thread every DRAIN_PERIOD_MS.
 *
 * Construct it on the UI thread after lv_init(); that thread becomes the UI
 * thread. The drain timer is owned by the dispatcher and deleted with it,
 * unless lv_deinit() has already freed it.
 *
 * Work that throws is logged and the rest of the batch still runs; nothing
 * propagates into lv_timer_handler().
 */

namespace halo::ui {

class LvglDispatcher : public UiDispatcher {
  public:
    static constexpr uint32_t DRAIN_PERIOD_MS = 5;

    LvglDispatcher();
    ~LvglDispatcher() override;

    LvglDispatcher(const LvglDispatcher&) = delete;
    LvglDispatcher& operator=(const LvglDispatcher&) = delete;

    bool is_ui_thread() const override;
    void post(Work work) override;

    /// Run everything queued so far (UI thread only)
    size_t drain();

    lv_timer_t* drain_timer() const {
        return drain_timer_;
    }

  private:
    static void drain_timer_cb(lv_timer_t* timer);

    std::thread::id ui_thread_;
    std::mutex mutex_;
    std::vector<Work> queue_;
    lv_timer_t* drain_timer_ = nullptr;
};

} // namespace halo::ui
