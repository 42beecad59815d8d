// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file animation_driver.h
 * @brief Abstract timing facility for float tweens
 *
 * A driver runs independent timelines. Each one interpolates a float from
 * @c from to @c to over a fixed duration and reports to a single handler:
 *
 *   Started -> Updated(value)* -> Ended
 *   Started -> Updated(value)* -> Cancelled   (after cancel())
 *
 * Cancellation is synchronous: the handler sees Cancelled before cancel()
 * returns. Handlers may start or cancel other timelines reentrantly.
 *
 * Implementations:
 * - LvglAnimationDriver: lv_anim based, ticks with the LVGL timer handler
 * - AnimationDriverMock: manual clock for unit tests
 */

#include <cstdint>
#include <functional>

namespace halo {

using AnimId = uint32_t;

/// Handle value meaning "no animation"
constexpr AnimId NO_ANIM = 0;

enum class Easing {
    LINEAR,
    EASE_IN_OUT,
};

enum class AnimEventType {
    STARTED,
    UPDATED,
    ENDED,
    CANCELLED,
};

struct AnimEvent {
    AnimEventType type;
    float value = 0.0f; ///< Interpolated value (meaningful for UPDATED)
};

struct AnimSpec {
    float from = 0.0f;
    float to = 1.0f;
    int duration_ms = 0;
    Easing easing = Easing::LINEAR;
};

using AnimHandler = std::function<void(const AnimEvent&)>;

class AnimationDriver {
  public:
    virtual ~AnimationDriver() = default;

    /**
     * @brief Start a new timeline
     *
     * The handler receives STARTED and the first UPDATED(from) before this
     * returns. A zero duration also delivers UPDATED(to) and ENDED.
     *
     * @return Handle for cancel(), or NO_ANIM if the timeline already ended
     */
    virtual AnimId start(const AnimSpec& spec, AnimHandler handler) = 0;

    /**
     * @brief Stop a running timeline
     * @return true if it was running (handler received CANCELLED)
     */
    virtual bool cancel(AnimId id) = 0;

    virtual bool is_running(AnimId id) const = 0;
};

/**
 * @brief Apply an easing curve to normalized time
 * @param t Elapsed fraction, clamped to [0,1]
 */
float apply_easing(Easing easing, float t);

/// Interpolated value of @p spec at elapsed fraction @p t
float interpolate(const AnimSpec& spec, float t);

} // namespace halo
