// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file ui_circle_progress.cpp
 * @brief LVGL object, XML widget and C-style API around halo::CircleProgress
 *
 * @pattern Registry of per-object data keyed by lv_obj_t*, freed on LV_EVENT_DELETE
 * @threading Setters re-dispatch to the LVGL thread through the shared LvglDispatcher
 * @gotchas The shared backends must be created on the LVGL thread after lv_init()
 */

#include "ui_circle_progress.h"

#include "circle_progress_config.h"
#include "lvgl_animation_driver.h"
#include "lvgl_render_surface.h"

#include "lvgl/src/xml/lv_xml.h"
#include "lvgl/src/xml/lv_xml_parser.h"
#include "lvgl/src/xml/lv_xml_widget.h"
#include "lvgl/src/xml/parsers/lv_xml_obj_parser.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// ============================================================================
// Constants
// ============================================================================

static constexpr int32_t DEFAULT_SIZE = 200;

// ============================================================================
// Shared backends and per-object data
// ============================================================================

namespace {

struct SharedBackends {
    halo::ui::LvglAnimationDriver driver;
    halo::ui::LvglDispatcher dispatcher;
    halo::ui::LvglIconLoader loader;
};

struct CircleProgressData {
    std::unique_ptr<halo::CircleProgress> widget;
    circle_progress_complete_cb_t complete_cb = nullptr;
    void* complete_user_data = nullptr;
};

std::unique_ptr<SharedBackends> s_backends;
halo::CircleProgressStyle s_default_style;
std::unordered_map<lv_obj_t*, CircleProgressData*> s_registry;

SharedBackends& ensure_backends() {
    if (!s_backends) {
        s_backends = std::make_unique<SharedBackends>();
        spdlog::debug("[CircleProgress] Shared LVGL backends created");
    }
    return *s_backends;
}

CircleProgressData* get_data(lv_obj_t* obj) {
    auto it = s_registry.find(obj);
    return (it != s_registry.end()) ? it->second : nullptr;
}

/**
 * Run @p fn against the widget behind @p obj on the LVGL thread. Lookup
 * happens on the LVGL thread too, so a queued call for a deleted object
 * finds nothing and is dropped.
 */
template <typename Fn> void with_widget(lv_obj_t* obj, const char* op, Fn fn) {
    if (!obj) {
        spdlog::warn("[CircleProgress] {}: object is null", op);
        return;
    }
    if (!s_backends) {
        spdlog::warn("[CircleProgress] {}: no circle_progress widgets exist", op);
        return;
    }

    s_backends->dispatcher.run_on_ui([obj, op, fn = std::move(fn)]() {
        CircleProgressData* data = get_data(obj);
        if (!data) {
            spdlog::warn("[CircleProgress] {}: object is not a circle_progress", op);
            return;
        }
        fn(*data->widget);
    });
}

/// Icon setters report load failures when called on the LVGL thread
template <typename Fn> bool with_icon(lv_obj_t* obj, const char* op, const char* resource, Fn fn) {
    if (!resource) {
        spdlog::error("[CircleProgress] {}: resource is null", op);
        return false;
    }
    if (s_backends && !s_backends->dispatcher.is_ui_thread()) {
        // Failures are logged when the queued call runs
        std::string res(resource);
        with_widget(obj, op, [op, res, fn](halo::CircleProgress& widget) {
            try {
                fn(widget, res);
            } catch (const halo::ResourceNotFound& e) {
                spdlog::error("[CircleProgress] {}: {}", op, e.what());
            }
        });
        return true;
    }

    CircleProgressData* data = obj ? get_data(obj) : nullptr;
    if (!data) {
        spdlog::warn("[CircleProgress] {}: object is not a circle_progress", op);
        return false;
    }
    try {
        fn(*data->widget, std::string(resource));
    } catch (const halo::ResourceNotFound& e) {
        spdlog::error("[CircleProgress] {}: {}", op, e.what());
        return false;
    }
    return true;
}

} // namespace

// ============================================================================
// Event Handlers
// ============================================================================

static void circle_progress_draw_cb(lv_event_t* e) {
    lv_obj_t* obj = lv_event_get_target_obj(e);
    CircleProgressData* data = get_data(obj);
    if (!data) {
        return;
    }

    lv_layer_t* layer = lv_event_get_layer(e);
    lv_area_t coords;
    lv_obj_get_coords(obj, &coords);

    halo::ui::LvglRenderSurface surface(layer, coords);
    data->widget->draw(surface);
}

static void circle_progress_delete_cb(lv_event_t* e) {
    lv_obj_t* obj = lv_event_get_target_obj(e);
    auto it = s_registry.find(obj);
    if (it != s_registry.end()) {
        // Widget destructor cancels its animations
        delete it->second;
        s_registry.erase(it);
        spdlog::trace("[CircleProgress] Deleted widget ({} remaining)", s_registry.size());
    }
}

// ============================================================================
// Construction
// ============================================================================

static lv_obj_t* circle_progress_create_obj(lv_obj_t* parent) {
    SharedBackends& backends = ensure_backends();

    lv_obj_t* obj = lv_obj_create(parent);
    if (!obj) {
        return nullptr;
    }

    auto* data = new CircleProgressData();
    data->widget = std::make_unique<halo::CircleProgress>(
        backends.driver, backends.dispatcher, backends.loader, [obj]() { lv_obj_invalidate(obj); });
    data->widget->apply_style(s_default_style);
    data->widget->set_on_complete([obj]() {
        CircleProgressData* d = get_data(obj);
        if (d && d->complete_cb) {
            d->complete_cb(obj, d->complete_user_data);
        }
    });
    s_registry[obj] = data;

    // Configure object
    lv_obj_set_size(obj, DEFAULT_SIZE, DEFAULT_SIZE);
    lv_obj_set_style_bg_opa(obj, LV_OPA_TRANSP, 0);
    lv_obj_set_style_border_width(obj, 0, 0);
    lv_obj_set_style_pad_all(obj, 0, 0);
    lv_obj_clear_flag(obj, LV_OBJ_FLAG_SCROLLABLE);

    // Register event handlers
    lv_obj_add_event_cb(obj, circle_progress_draw_cb, LV_EVENT_DRAW_MAIN, nullptr);
    lv_obj_add_event_cb(obj, circle_progress_delete_cb, LV_EVENT_DELETE, nullptr);

    return obj;
}

// ============================================================================
// XML Widget Interface
// ============================================================================

static void* circle_progress_xml_create(lv_xml_parser_state_t* state, const char** attrs) {
    LV_UNUSED(attrs);

    void* parent = lv_xml_state_get_parent(state);
    lv_obj_t* obj = circle_progress_create_obj(static_cast<lv_obj_t*>(parent));
    if (obj) {
        spdlog::debug("[CircleProgress] Created widget from XML");
    }
    return obj;
}

static void circle_progress_xml_apply(lv_xml_parser_state_t* state, const char** attrs) {
    void* item = lv_xml_state_get_item(state);
    lv_obj_t* obj = static_cast<lv_obj_t*>(item);
    if (!obj) {
        return;
    }

    lv_xml_obj_apply(state, attrs);

    CircleProgressData* data = get_data(obj);
    if (!data) {
        return;
    }
    halo::CircleProgress& widget = *data->widget;

    // Progress is applied last so duration/angle attributes take effect first
    const char* progress = nullptr;

    for (int i = 0; attrs[i]; i += 2) {
        const char* name = attrs[i];
        const char* value = attrs[i + 1];

        if (strcmp(name, "progress") == 0) {
            progress = value;
        } else if (strcmp(name, "duration") == 0) {
            widget.set_increment_duration(atoi(value));
        } else if (strcmp(name, "start_angle") == 0) {
            float angle = 0.0f;
            if (halo::parse_start_angle(value, angle)) {
                widget.set_start_angle(angle);
            } else {
                spdlog::warn("[CircleProgress] Invalid start_angle '{}'", value);
            }
        } else if (strcmp(name, "clockwise") == 0) {
            bool clockwise = true;
            if (halo::parse_bool(value, clockwise)) {
                widget.set_rotation_clockwise(clockwise);
            }
        } else if (strcmp(name, "border_width") == 0) {
            widget.set_border_width(atoi(value));
        } else if (strcmp(name, "border_color") == 0) {
            uint32_t color = 0;
            if (halo::parse_color(value, color)) {
                widget.set_border_color(color);
            } else {
                spdlog::warn("[CircleProgress] Invalid border_color '{}'", value);
            }
        } else if (strcmp(name, "circle_color") == 0) {
            uint32_t color = 0;
            if (halo::parse_color(value, color)) {
                widget.set_circle_color(color);
            } else {
                spdlog::warn("[CircleProgress] Invalid circle_color '{}'", value);
            }
        } else if (strcmp(name, "shadow_radius") == 0) {
            widget.set_shadow_radius(atoi(value));
        } else if (strcmp(name, "icon") == 0) {
            ui_circle_progress_set_icon(obj, value);
        }
    }

    if (progress) {
        widget.animate_progress(strtof(progress, nullptr));
    }
}

// ============================================================================
// Public API
// ============================================================================

void ui_circle_progress_register(void) {
    ensure_backends();

    static bool registered = false;
    if (registered) {
        return;
    }
    registered = true;

    lv_xml_register_widget("circle_progress", circle_progress_xml_create,
                           circle_progress_xml_apply);
    spdlog::info("[CircleProgress] Registered circle_progress widget with XML system");
}

void ui_circle_progress_shutdown(void) {
    if (!s_registry.empty()) {
        spdlog::warn("[CircleProgress] Shutdown with {} widgets still alive, deleting them",
                     s_registry.size());

        // Widgets hold references to the shared backends; delete them first.
        // Deleting one object may delete others nested inside it.
        std::vector<lv_obj_t*> alive;
        alive.reserve(s_registry.size());
        for (const auto& entry : s_registry) {
            alive.push_back(entry.first);
        }
        for (lv_obj_t* obj : alive) {
            if (s_registry.count(obj) != 0) {
                lv_obj_delete(obj);
            }
        }
    }
    s_backends.reset();
}

lv_obj_t* ui_circle_progress_create(lv_obj_t* parent) {
    if (!parent) {
        spdlog::error("[CircleProgress] Cannot create: parent is null");
        return nullptr;
    }

    lv_obj_t* obj = circle_progress_create_obj(parent);
    if (!obj) {
        spdlog::error("[CircleProgress] Failed to create object");
        return nullptr;
    }

    spdlog::debug("[CircleProgress] Created widget programmatically");
    return obj;
}

void ui_circle_progress_set_default_style(const halo::CircleProgressStyle& style) {
    s_default_style = style;
}

halo::CircleProgress* ui_circle_progress_get(lv_obj_t* obj) {
    CircleProgressData* data = get_data(obj);
    return data ? data->widget.get() : nullptr;
}

halo::ui::LvglIconLoader* ui_circle_progress_icon_loader(void) {
    return &ensure_backends().loader;
}

halo::ui::LvglDispatcher* ui_circle_progress_dispatcher(void) {
    return s_backends ? &s_backends->dispatcher : nullptr;
}

void ui_circle_progress_animate(lv_obj_t* obj, float progress) {
    with_widget(obj, "animate",
                [progress](halo::CircleProgress& w) { w.animate_progress(progress); });
}

void ui_circle_progress_reset(lv_obj_t* obj) {
    with_widget(obj, "reset", [](halo::CircleProgress& w) { w.reset(); });
}

void ui_circle_progress_set_duration(lv_obj_t* obj, int duration_ms) {
    with_widget(obj, "set_duration",
                [duration_ms](halo::CircleProgress& w) { w.set_increment_duration(duration_ms); });
}

void ui_circle_progress_set_start_angle(lv_obj_t* obj, float degrees) {
    with_widget(obj, "set_start_angle",
                [degrees](halo::CircleProgress& w) { w.set_start_angle(degrees); });
}

void ui_circle_progress_set_clockwise(lv_obj_t* obj, bool clockwise) {
    with_widget(obj, "set_clockwise",
                [clockwise](halo::CircleProgress& w) { w.set_rotation_clockwise(clockwise); });
}

void ui_circle_progress_set_border_width(lv_obj_t* obj, int width) {
    with_widget(obj, "set_border_width",
                [width](halo::CircleProgress& w) { w.set_border_width(width); });
}

void ui_circle_progress_set_border_color(lv_obj_t* obj, lv_color_t color) {
    uint32_t hex = lv_color_to_u32(color) & 0xFFFFFF;
    with_widget(obj, "set_border_color",
                [hex](halo::CircleProgress& w) { w.set_border_color(hex); });
}

void ui_circle_progress_set_circle_color(lv_obj_t* obj, lv_color_t color) {
    uint32_t hex = lv_color_to_u32(color) & 0xFFFFFF;
    with_widget(obj, "set_circle_color",
                [hex](halo::CircleProgress& w) { w.set_circle_color(hex); });
}

void ui_circle_progress_set_shadow_radius(lv_obj_t* obj, int radius) {
    with_widget(obj, "set_shadow_radius",
                [radius](halo::CircleProgress& w) { w.set_shadow_radius(radius); });
}

void ui_circle_progress_set_complete_callback(lv_obj_t* obj, circle_progress_complete_cb_t cb,
                                              void* user_data) {
    with_widget(obj, "set_complete_callback", [obj, cb, user_data](halo::CircleProgress&) {
        CircleProgressData* data = get_data(obj);
        if (data) {
            data->complete_cb = cb;
            data->complete_user_data = user_data;
        }
    });
}

bool ui_circle_progress_set_icon(lv_obj_t* obj, const char* resource) {
    return with_icon(obj, "set_icon", resource,
                     [](halo::CircleProgress& w, const std::string& res) { w.set_icon(res); });
}

bool ui_circle_progress_animate_icon(lv_obj_t* obj, const char* resource) {
    return with_icon(obj, "animate_icon", resource,
                     [](halo::CircleProgress& w, const std::string& res) {
                         w.animate_next_image(res);
                     });
}

float ui_circle_progress_get_progress(lv_obj_t* obj) {
    CircleProgressData* data = get_data(obj);
    return data ? data->widget->progress() : 0.0f;
}

bool ui_circle_progress_is_animating(lv_obj_t* obj) {
    CircleProgressData* data = get_data(obj);
    if (!data) {
        return false;
    }
    return data->widget->is_animating() || data->widget->is_fading();
}

void ui_circle_progress_stop_animations(lv_obj_t* obj) {
    with_widget(obj, "stop_animations", [](halo::CircleProgress& w) { w.stop_animations(); });
}
