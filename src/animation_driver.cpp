// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "animation_driver.h"

#include <algorithm>
#include <cmath>

namespace halo {

namespace {
constexpr float PI = 3.14159265358979f;
}

float apply_easing(Easing easing, float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    switch (easing) {
    case Easing::EASE_IN_OUT:
        // Accelerate/decelerate: (cos((t + 1) * pi) / 2) + 0.5
        return std::cos((t + 1.0f) * PI) / 2.0f + 0.5f;
    case Easing::LINEAR:
    default:
        return t;
    }
}

float interpolate(const AnimSpec& spec, float t) {
    if (t >= 1.0f) {
        return spec.to; // Exact end value, no float drift
    }
    return spec.from + (spec.to - spec.from) * apply_easing(spec.easing, t);
}

} // namespace halo
