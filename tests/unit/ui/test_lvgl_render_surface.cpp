// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "../../lvgl_test_fixture.h"
#include "lvgl_render_surface.h"

#include <catch2/catch_all.hpp>

using halo::ui::arc_angles_for_sweep;
using halo::ui::LvglRenderSurface;

namespace {

struct ArcAngles {
    float start;
    float end;
};

ArcAngles angles(float start_angle, float sweep_angle) {
    ArcAngles result{0.0f, 0.0f};
    arc_angles_for_sweep(start_angle, sweep_angle, result.start, result.end);
    return result;
}

} // namespace

TEST_CASE("arc_angles_for_sweep maps clockwise sweeps", "[lvgl][draw]") {
    ArcAngles a = angles(-90.0f, 90.0f);
    REQUIRE(a.start == 270.0f);
    REQUIRE(a.end == 0.0f);

    a = angles(-90.0f, 270.0f);
    REQUIRE(a.start == 270.0f);
    REQUIRE(a.end == 180.0f);

    a = angles(180.0f, 45.0f);
    REQUIRE(a.start == 180.0f);
    REQUIRE(a.end == 225.0f);
}

TEST_CASE("arc_angles_for_sweep reverses counter-clockwise sweeps", "[lvgl][draw]") {
    // Half circle counter-clockwise from the top ends at the bottom via the left
    ArcAngles a = angles(-90.0f, -180.0f);
    REQUIRE(a.start == 90.0f);
    REQUIRE(a.end == 270.0f);

    a = angles(0.0f, -45.0f);
    REQUIRE(a.start == 315.0f);
    REQUIRE(a.end == 0.0f);
}

TEST_CASE("arc_angles_for_sweep draws a full ring at 360 degrees", "[lvgl][draw]") {
    ArcAngles a = angles(-90.0f, 360.0f);
    REQUIRE(a.start == 0.0f);
    REQUIRE(a.end == 360.0f);

    a = angles(-90.0f, -360.0f);
    REQUIRE(a.start == 0.0f);
    REQUIRE(a.end == 360.0f);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglRenderSurface size follows the object coordinates",
                 "[lvgl][draw]") {
    lv_area_t coords;
    coords.x1 = 10;
    coords.y1 = 20;
    coords.x2 = 209;
    coords.y2 = 169;

    LvglRenderSurface surface(nullptr, coords);
    REQUIRE(surface.width() == 200);
    REQUIRE(surface.height() == 150);
}
