// SPDX-License-Identifier: GPL-2.0-only
#include "input/cursor.h"
#include <linux/input-event-codes.h>
#include <stdlib.h>
#include <time.h>
#include <wlr/types/wlr_cursor.h>
#include <wlr/types/wlr_layer_shell_v1.h>
#include <wlr/types/wlr_pointer.h>
#include <wlr/types/wlr_seat.h>
#include <wlr/types/wlr_xcursor_manager.h>
#include <wlr/util/log.h>
#include "config/rcxml.h"
#include "input/keyboard.h"
#include "layers.h"
#include "output.h"
#include "stackwc.h"

static uint32_t
msec_now(void)
{
	struct timespec now;
	clock_gettime(CLOCK_MONOTONIC, &now);
	return now.tv_sec * 1000 + now.tv_nsec / 1000000;
}

static struct wl_client *
client_of(struct wlr_surface *surface)
{
	return surface && surface->resource
		? wl_resource_get_client(surface->resource) : nullptr;
}

static void
set_cursor_surface(struct wlr_surface *surface, int32_t hotspot_x,
		int32_t hotspot_y, bool hidden)
{
	output_damage_cursor();

	if (g_seat.cursor_surface) {
		wl_list_remove(&g_seat.cursor_surface_destroy.link);
	}
	g_seat.cursor_surface = surface;
	g_seat.cursor_hotspot_x = hotspot_x;
	g_seat.cursor_hotspot_y = hotspot_y;
	g_seat.cursor_hidden = hidden;
	if (surface) {
		wl_signal_add(&surface->events.destroy,
			&g_seat.cursor_surface_destroy);
		output_enter_all(surface);
	}

	output_damage_cursor();
}

void
cursor_reset_image(void)
{
	if (!g_seat.cursor_surface && !g_seat.cursor_hidden) {
		return;
	}
	set_cursor_surface(nullptr, 0, 0, false);
}

static void
handle_cursor_surface_destroy(struct wl_listener *listener, void *data)
{
	set_cursor_surface(nullptr, 0, 0, false);
}

static void
process_motion(uint32_t time_msec)
{
	if (g_server.input_mode != SWC_INPUT_STATE_PASSTHROUGH) {
		interactive_motion();
		return;
	}

	double sx, sy;
	struct toplevel *client = nullptr;
	struct wlr_surface *surface = desktop_surface_at(g_seat.cursor->x,
		g_seat.cursor->y, &sx, &sy, &client);

	/* focus follows the pointer */
	if (client && g_server.workspaces.current().active != client) {
		g_server.workspaces.set_active(client);
	}

	struct wlr_seat *seat = g_seat.wlr_seat;
	if (!surface) {
		wlr_seat_pointer_notify_clear_focus(seat);
		cursor_reset_image();
		return;
	}
	struct wlr_surface *focused = seat->pointer_state.focused_surface;
	if (focused != surface && client_of(focused) != client_of(surface)) {
		/* the new client sets its own image on enter */
		cursor_reset_image();
	}
	wlr_seat_pointer_notify_enter(seat, surface, sx, sy);
	wlr_seat_pointer_notify_motion(seat, time_msec, sx, sy);
}

void
cursor_update_focus(void)
{
	if (!g_seat.cursor || g_server.input_mode != SWC_INPUT_STATE_PASSTHROUGH) {
		return;
	}
	process_motion(msec_now());
}

void
cursor_warp(double lx, double ly)
{
	output_damage_cursor();
	wlr_cursor_warp(g_seat.cursor, nullptr, lx, ly);
	output_damage_cursor();
	cursor_update_focus();
}

static void
handle_motion(struct wl_listener *listener, void *data)
{
	auto event = (struct wlr_pointer_motion_event *)data;
	output_damage_cursor();
	wlr_cursor_move(g_seat.cursor, &event->pointer->base, event->delta_x,
		event->delta_y);
	output_damage_cursor();
	process_motion(event->time_msec);
}

static void
handle_motion_absolute(struct wl_listener *listener, void *data)
{
	auto event = (struct wlr_pointer_motion_absolute_event *)data;
	output_damage_cursor();
	wlr_cursor_warp_absolute(g_seat.cursor, &event->pointer->base,
		event->x, event->y);
	output_damage_cursor();
	process_motion(event->time_msec);
}

/* Modifier + left button moves, modifier + right button resizes */
static bool
begin_modifier_grab(uint32_t button)
{
	if (!rc.mouse_modifier
			|| keyboard_get_all_modifiers() != rc.mouse_modifier) {
		return false;
	}
	if (button != BTN_LEFT && button != BTN_RIGHT) {
		return false;
	}
	struct toplevel *client = g_server.workspaces.window_at(
		g_seat.cursor->x, g_seat.cursor->y);
	if (!client) {
		return false;
	}
	g_server.workspaces.set_active(client);
	if (button == BTN_LEFT) {
		interactive_begin(client, SWC_INPUT_STATE_MOVE, SWC_EDGE_NONE);
	} else {
		interactive_begin(client, SWC_INPUT_STATE_RESIZE, SWC_EDGE_NONE);
	}
	return g_server.input_mode != SWC_INPUT_STATE_PASSTHROUGH;
}

static void
focus_layer_on_press(void)
{
	double sx, sy;
	struct toplevel *client = nullptr;
	struct wlr_surface *surface = desktop_surface_at(g_seat.cursor->x,
		g_seat.cursor->y, &sx, &sy, &client);
	if (!surface || client) {
		return;
	}
	struct wlr_layer_surface_v1 *layer_surface =
		wlr_layer_surface_v1_try_from_wlr_surface(
			wlr_surface_get_root_surface(surface));
	if (layer_surface && layer_surface->current.keyboard_interactive) {
		layer_try_set_focus(layer_surface);
	}
}

static void
handle_button(struct wl_listener *listener, void *data)
{
	auto event = (struct wlr_pointer_button_event *)data;
	struct wlr_seat *seat = g_seat.wlr_seat;

	if (event->state == WL_POINTER_BUTTON_STATE_PRESSED) {
		if (g_server.input_mode == SWC_INPUT_STATE_PASSTHROUGH) {
			if (!begin_modifier_grab(event->button)) {
				focus_layer_on_press();
			}
		}
		uint32_t serial = wlr_seat_pointer_notify_button(seat,
			event->time_msec, event->button, event->state);
		g_seat.pressed.press(event->button, serial);
		return;
	}

	g_seat.pressed.release(event->button);
	wlr_seat_pointer_notify_button(seat, event->time_msec, event->button,
		event->state);
	if (g_server.input_mode != SWC_INPUT_STATE_PASSTHROUGH
			&& g_seat.pressed.empty()) {
		interactive_finish();
	}
}

static void
handle_axis(struct wl_listener *listener, void *data)
{
	auto event = (struct wlr_pointer_axis_event *)data;
	wlr_seat_pointer_notify_axis(g_seat.wlr_seat, event->time_msec,
		event->orientation, event->delta, event->delta_discrete,
		event->source, event->relative_direction);
}

static void
handle_frame(struct wl_listener *listener, void *data)
{
	wlr_seat_pointer_notify_frame(g_seat.wlr_seat);
}

static void
handle_request_set_cursor(struct wl_listener *listener, void *data)
{
	auto event = (struct wlr_seat_pointer_request_set_cursor_event *)data;

	/* the grab owns the pointer */
	if (g_server.input_mode != SWC_INPUT_STATE_PASSTHROUGH) {
		return;
	}
	if (event->seat_client != g_seat.wlr_seat->pointer_state.focused_client) {
		wlr_log(WLR_DEBUG, "cursor image request from unfocused client");
		return;
	}
	set_cursor_surface(event->surface, event->hotspot_x, event->hotspot_y,
		/* hidden */ !event->surface);
}

void
cursor_init(void)
{
	g_seat.cursor = wlr_cursor_create();
	if (!g_seat.cursor) {
		wlr_log(WLR_ERROR, "unable to create cursor");
		exit(EXIT_FAILURE);
	}
	wlr_cursor_attach_output_layout(g_seat.cursor, g_server.output_layout);

	const char *theme = getenv("XCURSOR_THEME");
	const char *size_env = getenv("XCURSOR_SIZE");
	int size = size_env ? atoi(size_env) : 0;
	if (size <= 0) {
		size = XCURSOR_SIZE;
	}
	g_seat.xcursor_manager = wlr_xcursor_manager_create(theme, size);
	if (!g_seat.xcursor_manager) {
		wlr_log(WLR_ERROR, "unable to load cursor theme, using the "
			"built-in cursor");
	}

	g_seat.cursor_surface_destroy.notify = handle_cursor_surface_destroy;

	g_seat.on_cursor.motion.notify = handle_motion;
	wl_signal_add(&g_seat.cursor->events.motion, &g_seat.on_cursor.motion);
	g_seat.on_cursor.motion_absolute.notify = handle_motion_absolute;
	wl_signal_add(&g_seat.cursor->events.motion_absolute,
		&g_seat.on_cursor.motion_absolute);
	g_seat.on_cursor.button.notify = handle_button;
	wl_signal_add(&g_seat.cursor->events.button, &g_seat.on_cursor.button);
	g_seat.on_cursor.axis.notify = handle_axis;
	wl_signal_add(&g_seat.cursor->events.axis, &g_seat.on_cursor.axis);
	g_seat.on_cursor.frame.notify = handle_frame;
	wl_signal_add(&g_seat.cursor->events.frame, &g_seat.on_cursor.frame);

	g_seat.request_set_cursor.notify = handle_request_set_cursor;
	wl_signal_add(&g_seat.wlr_seat->events.request_set_cursor,
		&g_seat.request_set_cursor);
}

void
cursor_finish(void)
{
	if (g_seat.cursor_surface) {
		wl_list_remove(&g_seat.cursor_surface_destroy.link);
		g_seat.cursor_surface = nullptr;
	}
	wl_list_remove(&g_seat.on_cursor.motion.link);
	wl_list_remove(&g_seat.on_cursor.motion_absolute.link);
	wl_list_remove(&g_seat.on_cursor.button.link);
	wl_list_remove(&g_seat.on_cursor.axis.link);
	wl_list_remove(&g_seat.on_cursor.frame.link);
	wl_list_remove(&g_seat.request_set_cursor.link);

	if (g_seat.xcursor_manager) {
		wlr_xcursor_manager_destroy(g_seat.xcursor_manager);
		g_seat.xcursor_manager = nullptr;
	}
	wlr_cursor_destroy(g_seat.cursor);
	g_seat.cursor = nullptr;
}
