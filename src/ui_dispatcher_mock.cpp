// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_dispatcher_mock.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace halo {

bool UiDispatcherMock::is_ui_thread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return on_ui_thread_;
}

void UiDispatcherMock::post(Work work) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(work));
}

void UiDispatcherMock::set_ui_thread(bool on_ui_thread) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_ui_thread_ = on_ui_thread;
}

size_t UiDispatcherMock::drain() {
    std::vector<Work> batch;
    bool was_ui_thread;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queue_);
        was_ui_thread = std::exchange(on_ui_thread_, true); // Drained work runs on the UI thread
    }
    for (auto& work : batch) {
        try {
            work();
        } catch (const std::exception& e) {
            spdlog::error("[UiDispatcher] Queued work failed: {}", e.what());
        }
    }
    set_ui_thread(was_ui_thread);
    return batch.size();
}

size_t UiDispatcherMock::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace halo
