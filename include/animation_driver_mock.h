// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "animation_driver.h"

#include <map>

/**
 * @file animation_driver_mock.h
 * @brief Manually clocked animation driver for tests and headless runs
 *
 * Time only moves when advance() is called, so tests can assert the exact
 * value of every frame:
 *
 * @code
 * halo::AnimationDriverMock driver;
 * widget.animate_progress(0.5f);   // frame at t=0 delivered immediately
 * driver.advance(250);             // one frame at t=250ms
 * driver.run_to_completion();      // final frame + ENDED
 * @endcode
 */

namespace halo {

class AnimationDriverMock : public AnimationDriver {
  public:
    AnimationDriverMock() = default;
    ~AnimationDriverMock() override = default;

    AnimId start(const AnimSpec& spec, AnimHandler handler) override;
    bool cancel(AnimId id) override;
    bool is_running(AnimId id) const override;

    // ========================================================================
    // Mock-specific methods (for testing)
    // ========================================================================

    /**
     * @brief Advance the clock and deliver one UPDATED per running timeline
     *
     * Timelines that reach their duration also receive ENDED. Timelines
     * started by handlers during this call begin at the new time.
     */
    void advance(int ms);

    /// Advance until nothing is running (bounded by @p max_ms)
    void run_to_completion(int step_ms = 16, int max_ms = 60000);

    size_t running_count() const {
        return running_.size();
    }

    /// Spec of a running timeline (default spec if unknown)
    AnimSpec spec_of(AnimId id) const;

    int started_count() const {
        return started_count_;
    }

    int cancelled_count() const {
        return cancelled_count_;
    }

  private:
    struct Timeline {
        AnimSpec spec;
        AnimHandler handler;
        int elapsed_ms = 0;
    };

    std::map<AnimId, Timeline> running_;
    AnimId next_id_ = 1;
    int started_count_ = 0;
    int cancelled_count_ = 0;
};

} // namespace halo
