// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ui_dispatcher.h"

#include <mutex>
#include <vector>

/**
 * @file ui_dispatcher_mock.h
 * @brief Dispatcher with a controllable notion of "UI thread"
 *
 * By default every caller counts as the UI thread, so work runs inline. Tests
 * flip set_ui_thread(false) to simulate calls from a worker thread and then
 * drain() to play the queued work back.
 */

namespace halo {

class UiDispatcherMock : public UiDispatcher {
  public:
    bool is_ui_thread() const override;
    void post(Work work) override;

    // ========================================================================
    // Mock-specific methods (for testing)
    // ========================================================================

    void set_ui_thread(bool on_ui_thread);

    /// Run queued work in FIFO order; returns the number of items run
    size_t drain();

    size_t pending() const;

  private:
    mutable std::mutex mutex_;
    bool on_ui_thread_ = true;
    std::vector<Work> queue_;
};

} // namespace halo
