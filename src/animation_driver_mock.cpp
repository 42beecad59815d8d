// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "animation_driver_mock.h"

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace halo {

AnimId AnimationDriverMock::start(const AnimSpec& spec, AnimHandler handler) {
    started_count_++;
    AnimId id = next_id_++;

    handler({AnimEventType::STARTED, spec.from});
    handler({AnimEventType::UPDATED, spec.from});

    if (spec.duration_ms <= 0) {
        handler({AnimEventType::UPDATED, spec.to});
        handler({AnimEventType::ENDED, spec.to});
        return NO_ANIM;
    }

    running_[id] = Timeline{spec, std::move(handler), 0};
    spdlog::trace("[AnimDriverMock] Started #{} {:.3f} -> {:.3f} over {}ms", id, spec.from,
                  spec.to, spec.duration_ms);
    return id;
}

bool AnimationDriverMock::cancel(AnimId id) {
    auto it = running_.find(id);
    if (it == running_.end()) {
        return false;
    }

    AnimHandler handler = std::move(it->second.handler);
    running_.erase(it);
    cancelled_count_++;
    spdlog::trace("[AnimDriverMock] Cancelled #{}", id);
    handler({AnimEventType::CANCELLED, 0.0f});
    return true;
}

bool AnimationDriverMock::is_running(AnimId id) const {
    return running_.count(id) > 0;
}

AnimSpec AnimationDriverMock::spec_of(AnimId id) const {
    auto it = running_.find(id);
    return it != running_.end() ? it->second.spec : AnimSpec{};
}

void AnimationDriverMock::advance(int ms) {
    // Snapshot ids: handlers may start or cancel timelines
    std::vector<AnimId> ids;
    ids.reserve(running_.size());
    for (const auto& entry : running_) {
        ids.push_back(entry.first);
    }

    for (AnimId id : ids) {
        auto it = running_.find(id);
        if (it == running_.end()) {
            continue; // Cancelled by an earlier handler
        }

        Timeline& timeline = it->second;
        timeline.elapsed_ms += ms;
        float t = static_cast<float>(timeline.elapsed_ms) /
                  static_cast<float>(timeline.spec.duration_ms);
        float value = interpolate(timeline.spec, t);

        if (timeline.elapsed_ms < timeline.spec.duration_ms) {
            // Copy so a reentrant cancel() of this id can't destroy the running handler
            AnimHandler handler = timeline.handler;
            handler({AnimEventType::UPDATED, value});
            continue;
        }

        AnimHandler handler = std::move(timeline.handler);
        running_.erase(it);
        handler({AnimEventType::UPDATED, value});
        handler({AnimEventType::ENDED, value});
    }
}

void AnimationDriverMock::run_to_completion(int step_ms, int max_ms) {
    for (int elapsed = 0; !running_.empty() && elapsed < max_ms; elapsed += step_ms) {
        advance(step_ms);
    }
    if (!running_.empty()) {
        spdlog::warn("[AnimDriverMock] {} timeline(s) still running after {}ms", running_.size(),
                     max_ms);
    }
}

} // namespace halo
