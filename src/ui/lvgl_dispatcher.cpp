// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_dispatcher.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace halo::ui {

LvglDispatcher::LvglDispatcher() : ui_thread_(std::this_thread::get_id()) {
    drain_timer_ = lv_timer_create(drain_timer_cb, DRAIN_PERIOD_MS, this);
    spdlog::debug("[UiDispatcher] Created, draining every {}ms", DRAIN_PERIOD_MS);
}

LvglDispatcher::~LvglDispatcher() {
    // After lv_deinit() the timer is already gone
    if (drain_timer_ && lv_is_initialized()) {
        lv_timer_delete(drain_timer_);
    }
    drain_timer_ = nullptr;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!queue_.empty()) {
        spdlog::debug("[UiDispatcher] Discarding {} queued item(s) on shutdown", queue_.size());
    }
}

bool LvglDispatcher::is_ui_thread() const {
    return std::this_thread::get_id() == ui_thread_;
}

void LvglDispatcher::post(Work work) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(work));
}

size_t LvglDispatcher::drain() {
    std::vector<Work> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queue_);
    }

    // Run outside the lock: work may post() again
    for (auto& work : batch) {
        try {
            work();
        } catch (const std::exception& e) {
            spdlog::error("[UiDispatcher] Queued work failed: {}", e.what());
        }
    }

    if (!batch.empty()) {
        spdlog::trace("[UiDispatcher] Ran {} queued item(s)", batch.size());
    }
    return batch.size();
}

void LvglDispatcher::drain_timer_cb(lv_timer_t* timer) {
    auto* self = static_cast<LvglDispatcher*>(lv_timer_get_user_data(timer));
    if (self) {
        self->drain();
    }
}

} // namespace halo::ui
