// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_ui_circle_progress.cpp
 * @brief circle_progress LVGL object: C API, XML attributes, thread dispatch
 *
 * The widget shares one lv_anim driver and dispatcher across instances, so
 * time only advances through process_lvgl().
 */

#include "../../log_capture.h"
#include "../../lvgl_test_fixture.h"
#include "ui_circle_progress.h"

#include <thread>

#include <catch2/catch_all.hpp>

using Catch::Approx;

namespace {

uint8_t s_pixels[24 * 24 * 4] = {};

const lv_image_dsc_t* test_image() {
    static lv_image_dsc_t dsc = []() {
        lv_image_dsc_t d = {};
        d.header.magic = LV_IMAGE_HEADER_MAGIC;
        d.header.cf = LV_COLOR_FORMAT_ARGB8888;
        d.header.w = 24;
        d.header.h = 24;
        d.header.stride = 24 * 4;
        d.data_size = sizeof(s_pixels);
        d.data = s_pixels;
        return d;
    }();
    return &dsc;
}

struct CompleteCounter {
    int calls = 0;
    lv_obj_t* last_obj = nullptr;

    static void cb(lv_obj_t* obj, void* user_data) {
        auto* self = static_cast<CompleteCounter*>(user_data);
        self->calls++;
        self->last_obj = obj;
    }
};

} // namespace

class CircleProgressWidgetFixture : public LVGLTestFixture {
  protected:
    CircleProgressWidgetFixture() {
        ui_circle_progress_set_default_style(halo::CircleProgressStyle());
        ui_circle_progress_register();
        ui_circle_progress_icon_loader()->register_image("test_icon", test_image());
        ui_circle_progress_icon_loader()->register_image("test_icon_2", test_image());
        obj = ui_circle_progress_create(test_screen());
    }

    lv_obj_t* obj = nullptr;
};

// ============================================================================
// Creation
// ============================================================================

TEST_CASE_METHOD(CircleProgressWidgetFixture, "circle_progress creates a transparent object",
                 "[ui][circle_progress]") {
    REQUIRE(obj != nullptr);
    REQUIRE(ui_circle_progress_get(obj) != nullptr);
    REQUIRE(lv_obj_get_style_bg_opa(obj, LV_PART_MAIN) == LV_OPA_TRANSP);
    REQUIRE_FALSE(lv_obj_has_flag(obj, LV_OBJ_FLAG_SCROLLABLE));

    lv_obj_update_layout(obj);
    REQUIRE(lv_obj_get_width(obj) == 200);
    REQUIRE(lv_obj_get_height(obj) == 200);

    REQUIRE(ui_circle_progress_get_progress(obj) == 0.0f);
    REQUIRE_FALSE(ui_circle_progress_is_animating(obj));
}

TEST_CASE_METHOD(LVGLTestFixture, "circle_progress create rejects a null parent",
                 "[ui][circle_progress]") {
    LogCapture log;
    REQUIRE(ui_circle_progress_create(nullptr) == nullptr);
    REQUIRE(log.contains("parent is null"));
}

TEST_CASE_METHOD(CircleProgressWidgetFixture, "circle_progress uses the default style",
                 "[ui][circle_progress]") {
    halo::CircleProgressStyle style;
    style.border_width = 4;
    style.border_color = 0x4CAF50;
    ui_circle_progress_set_default_style(style);

    lv_obj_t* styled = ui_circle_progress_create(test_screen());
    REQUIRE(ui_circle_progress_get(styled)->style().border_width == 4);
    REQUIRE(ui_circle_progress_get(styled)->style().border_color == 0x4CAF50);

    // Existing widgets keep their style
    REQUIRE(ui_circle_progress_get(obj)->style().border_width == 10);
}

TEST_CASE_METHOD(CircleProgressWidgetFixture, "Deleting the object frees the widget",
                 "[ui][circle_progress]") {
    lv_obj_delete(obj);
    REQUIRE(ui_circle_progress_get(obj) == nullptr);
    obj = nullptr;
}

TEST_CASE_METHOD(CircleProgressWidgetFixture, "API on a foreign object logs and does nothing",
                 "[ui][circle_progress]") {
    lv_obj_t* plain = lv_obj_create(test_screen());
    LogCapture log;

    ui_circle_progress_animate(plain, 0.5f);
    REQUIRE(log.contains("not a circle_progress"));
    REQUIRE(ui_circle_progress_get(plain) == nullptr);
    REQUIRE(ui_circle_progress_get_progress(plain) == 0.0f);
    REQUIRE_FALSE(ui_circle_progress_set_icon(plain, "test_icon"));

    log.clear();
    ui_circle_progress_reset(nullptr);
    REQUIRE(log.contains("object is null"));
}

// ============================================================================
// Progress
// ============================================================================

TEST_CASE_METHOD(CircleProgressWidgetFixture, "ui_circle_progress_animate runs on lv_anim",
                 "[ui][circle_progress]") {
    ui_circle_progress_animate(obj, 0.75f);
    REQUIRE(ui_circle_progress_is_animating(obj));

    process_lvgl(250);
    float mid = ui_circle_progress_get_progress(obj);
    REQUIRE(mid > 0.0f);
    REQUIRE(mid < 0.75f);

    process_lvgl(400);
    REQUIRE_FALSE(ui_circle_progress_is_animating(obj));
    REQUIRE(ui_circle_progress_get_progress(obj) == 0.75f);
    REQUIRE(ui_circle_progress_get(obj)->sweep_angle() == Approx(270.0f));
}

TEST_CASE_METHOD(CircleProgressWidgetFixture, "Complete callback fires once at 100%",
                 "[ui][circle_progress]") {
    CompleteCounter counter;
    ui_circle_progress_set_complete_callback(obj, CompleteCounter::cb, &counter);

    ui_circle_progress_animate(obj, 0.5f);
    process_lvgl(600);
    REQUIRE(counter.calls == 0);

    ui_circle_progress_animate(obj, 1.0f);
    process_lvgl(600);
    REQUIRE(counter.calls == 1);
    REQUIRE(counter.last_obj == obj);

    ui_circle_progress_animate(obj, 1.0f);
    process_lvgl(600);
    REQUIRE(counter.calls == 1);
}

TEST_CASE_METHOD(CircleProgressWidgetFixture, "Setters reach the widget",
                 "[ui][circle_progress]") {
    ui_circle_progress_set_duration(obj, 100);
    ui_circle_progress_set_start_angle(obj, halo::start_angle::RIGHT);
    ui_circle_progress_set_clockwise(obj, false);
    ui_circle_progress_set_border_width(obj, 3);
    ui_circle_progress_set_border_color(obj, lv_color_hex(0xFF5722));
    ui_circle_progress_set_circle_color(obj, lv_color_hex(0x212121));
    ui_circle_progress_set_shadow_radius(obj, 6);

    const halo::CircleProgressStyle& style = ui_circle_progress_get(obj)->style();
    REQUIRE(style.increment_duration_ms == 100);
    REQUIRE(style.start_angle == 0.0f);
    REQUIRE(style.rotation == halo::Rotation::COUNTER_CLOCKWISE);
    REQUIRE(style.border_width == 3);
    REQUIRE(style.border_color == 0xFF5722);
    REQUIRE(style.circle_color == 0x212121);
    REQUIRE(style.shadow_radius == 6);

    ui_circle_progress_animate(obj, 0.5f);
    process_lvgl(150);
    REQUIRE(ui_circle_progress_get(obj)->sweep_angle() == Approx(-180.0f));
}

TEST_CASE_METHOD(CircleProgressWidgetFixture, "reset and stop_animations",
                 "[ui][circle_progress]") {
    ui_circle_progress_animate(obj, 1.0f);
    process_lvgl(200);

    ui_circle_progress_stop_animations(obj);
    float frozen = ui_circle_progress_get_progress(obj);
    process_lvgl(600);
    REQUIRE(ui_circle_progress_get_progress(obj) == frozen);

    ui_circle_progress_reset(obj);
    REQUIRE(ui_circle_progress_get_progress(obj) == 0.0f);
    REQUIRE(ui_circle_progress_get(obj)->target_progress() == 0.0f);
}

TEST_CASE_METHOD(CircleProgressWidgetFixture, "Rendering a frame does not disturb state",
                 "[ui][circle_progress][draw]") {
    lv_obj_set_size(obj, 120, 120);
    ui_circle_progress_set_icon(obj, "test_icon");
    ui_circle_progress_animate(obj, 0.5f);
    process_lvgl(600);

    lv_refr_now(nullptr);

    REQUIRE(ui_circle_progress_get_progress(obj) == 0.5f);
    REQUIRE(ui_circle_progress_get(obj)->icon()->source == "test_icon");
}

// ============================================================================
// Icons
// ============================================================================

TEST_CASE_METHOD(CircleProgressWidgetFixture, "Icons load through the shared loader",
                 "[ui][circle_progress][icons]") {
    REQUIRE(ui_circle_progress_set_icon(obj, "test_icon"));
    REQUIRE(ui_circle_progress_get(obj)->icon()->width == 24);

    REQUIRE(ui_circle_progress_animate_icon(obj, "test_icon_2"));
    REQUIRE(ui_circle_progress_is_animating(obj));

    process_lvgl(600);
    REQUIRE_FALSE(ui_circle_progress_is_animating(obj));
    REQUIRE(ui_circle_progress_get(obj)->icon()->source == "test_icon_2");
}

TEST_CASE_METHOD(CircleProgressWidgetFixture, "Missing icons report failure",
                 "[ui][circle_progress][icons][errors]") {
    REQUIRE(ui_circle_progress_set_icon(obj, "test_icon"));

    LogCapture log;
    REQUIRE_FALSE(ui_circle_progress_set_icon(obj, "A:missing/icon.png"));
    REQUIRE_FALSE(ui_circle_progress_animate_icon(obj, "missing"));
    REQUIRE_FALSE(ui_circle_progress_set_icon(obj, nullptr));
    REQUIRE(log.contains("error"));

    REQUIRE(ui_circle_progress_get(obj)->icon()->source == "test_icon");
    REQUIRE_FALSE(ui_circle_progress_is_animating(obj));
}

// ============================================================================
// Threading
// ============================================================================

TEST_CASE_METHOD(CircleProgressWidgetFixture, "Worker thread calls apply on the LVGL thread",
                 "[ui][circle_progress][threading]") {
    std::thread worker([this]() {
        ui_circle_progress_set_border_width(obj, 2);
        ui_circle_progress_animate(obj, 0.4f);
        // Queued: failure can only be logged later
        ui_circle_progress_set_icon(obj, "test_icon");
    });
    worker.join();

    REQUIRE(ui_circle_progress_get(obj)->style().border_width == 10);
    REQUIRE_FALSE(ui_circle_progress_is_animating(obj));

    process_lvgl(halo::ui::LvglDispatcher::DRAIN_PERIOD_MS * 2);
    REQUIRE(ui_circle_progress_get(obj)->style().border_width == 2);
    REQUIRE(ui_circle_progress_get(obj)->icon());

    process_lvgl(600);
    REQUIRE(ui_circle_progress_get_progress(obj) == 0.4f);
}

TEST_CASE_METHOD(CircleProgressWidgetFixture, "Work queued for a deleted object is dropped",
                 "[ui][circle_progress][threading]") {
    lv_obj_t* doomed = obj;
    std::thread worker([doomed]() { ui_circle_progress_animate(doomed, 0.9f); });
    worker.join();

    lv_obj_delete(doomed);
    obj = nullptr;

    LogCapture log;
    REQUIRE_NOTHROW(process_lvgl(20));
    REQUIRE(log.contains("not a circle_progress"));
}

// ============================================================================
// XML
// ============================================================================

TEST_CASE_METHOD(CircleProgressWidgetFixture, "XML attributes configure the widget",
                 "[ui][circle_progress][xml]") {
    const char* attrs[] = {"width",        "150",      "height",        "150",
                           "border_width", "4",        "border_color",  "#FF0000",
                           "circle_color", "0x00FF00", "shadow_radius", "8",
                           "start_angle",  "left",     "clockwise",     "false",
                           "duration",     "300",      "icon",          "test_icon",
                           "progress",     "0.5",      nullptr,         nullptr};

    auto* xml_obj = static_cast<lv_obj_t*>(lv_xml_create(test_screen(), "circle_progress", attrs));
    REQUIRE(xml_obj != nullptr);

    halo::CircleProgress* widget = ui_circle_progress_get(xml_obj);
    REQUIRE(widget != nullptr);
    REQUIRE(widget->style().border_width == 4);
    REQUIRE(widget->style().border_color == 0xFF0000);
    REQUIRE(widget->style().circle_color == 0x00FF00);
    REQUIRE(widget->style().shadow_radius == 8);
    REQUIRE(widget->style().start_angle == 180.0f);
    REQUIRE(widget->style().rotation == halo::Rotation::COUNTER_CLOCKWISE);
    REQUIRE(widget->style().increment_duration_ms == 300);
    REQUIRE(widget->icon()->source == "test_icon");
    REQUIRE(widget->is_animating());

    lv_obj_update_layout(xml_obj);
    REQUIRE(lv_obj_get_width(xml_obj) == 150);

    process_lvgl(400);
    REQUIRE(widget->progress() == 0.5f);
    REQUIRE(widget->sweep_angle() == Approx(-180.0f));
}

TEST_CASE_METHOD(CircleProgressWidgetFixture, "Invalid XML values are logged and ignored",
                 "[ui][circle_progress][xml]") {
    const char* attrs[] = {"border_color", "teal", "start_angle", "upwards", nullptr, nullptr};

    LogCapture log;
    auto* xml_obj = static_cast<lv_obj_t*>(lv_xml_create(test_screen(), "circle_progress", attrs));
    REQUIRE(xml_obj != nullptr);

    halo::CircleProgress* widget = ui_circle_progress_get(xml_obj);
    REQUIRE(widget->style().border_color == 0x0000FF);
    REQUIRE(widget->style().start_angle == halo::start_angle::TOP);
    REQUIRE(log.contains("Invalid border_color"));
    REQUIRE(log.contains("Invalid start_angle"));
}

TEST_CASE_METHOD(CircleProgressWidgetFixture, "Non-finite XML progress is ignored",
                 "[ui][circle_progress][xml]") {
    const char* attrs[] = {"progress", "nan", nullptr, nullptr};

    LogCapture log;
    auto* xml_obj = static_cast<lv_obj_t*>(lv_xml_create(test_screen(), "circle_progress", attrs));
    REQUIRE(xml_obj != nullptr);

    REQUIRE_FALSE(ui_circle_progress_is_animating(xml_obj));
    REQUIRE(ui_circle_progress_get_progress(xml_obj) == 0.0f);
    REQUIRE(log.contains("non-finite progress"));
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_CASE_METHOD(CircleProgressWidgetFixture, "Shutdown deletes widgets that are still alive",
                 "[ui][circle_progress][lifecycle]") {
    const char* attrs[] = {"progress", "0.5", "icon", "test_icon", nullptr, nullptr};
    auto* xml_obj = static_cast<lv_obj_t*>(lv_xml_create(test_screen(), "circle_progress", attrs));
    REQUIRE(xml_obj != nullptr);
    REQUIRE(ui_circle_progress_animate_icon(obj, "test_icon_2"));
    REQUIRE(ui_circle_progress_is_animating(xml_obj));
    REQUIRE(ui_circle_progress_is_animating(obj));

    LogCapture log;
    ui_circle_progress_shutdown();

    REQUIRE(log.contains("2 widgets still alive"));
    REQUIRE(ui_circle_progress_get(xml_obj) == nullptr);
    REQUIRE(ui_circle_progress_get(obj) == nullptr);
    REQUIRE(ui_circle_progress_dispatcher() == nullptr);
    REQUIRE(lv_obj_get_child_count(test_screen()) == 0);
    obj = nullptr;

    // Animation timers of the deleted widgets are gone
    process_lvgl(600);

    // Shared backends come back on the next registration
    ui_circle_progress_register();
    REQUIRE(ui_circle_progress_dispatcher() != nullptr);
    lv_obj_t* fresh = ui_circle_progress_create(test_screen());
    ui_circle_progress_animate(fresh, 1.0f);
    process_lvgl(600);
    REQUIRE(ui_circle_progress_get_progress(fresh) == 1.0f);
}
