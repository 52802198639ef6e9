// SPDX-License-Identifier: GPL-2.0-only
#include <assert.h>
#include <stdlib.h>
#include <wlr/types/wlr_input_device.h>
#include <wlr/types/wlr_keyboard.h>
#include <wlr/types/wlr_layer_shell_v1.h>
#include <wlr/types/wlr_seat.h>
#include <wlr/util/log.h>
#include "input/input.h"
#include "input/keyboard.h"
#include "stackwc.h"
#include "window.h"

void
seat_init(void)
{
	g_seat.wlr_seat = wlr_seat_create(g_server.wl_display, "seat0");
	if (!g_seat.wlr_seat) {
		wlr_log(WLR_ERROR, "cannot allocate seat");
		exit(EXIT_FAILURE);
	}

	inputs_init();
}

void
seat_finish(void)
{
	g_seat.focused_layer = nullptr;
	inputs_finish();
}

void
seat_reconfigure(void)
{
	keyboard_configure(&g_seat.keyboard_group->keyboard);
	for (auto input : g_seat.inputs) {
		if (input->wlr_input_device->type == WLR_INPUT_DEVICE_KEYBOARD) {
			auto keyboard = static_cast<struct keyboard *>(input);
			keyboard_configure(keyboard->wlr_keyboard);
		}
	}
}

static void
focus_surface(struct wlr_surface *surface)
{
	struct wlr_seat *seat = g_seat.wlr_seat;
	if (!surface) {
		wlr_seat_keyboard_notify_clear_focus(seat);
		return;
	}
	if (seat->keyboard_state.focused_surface == surface) {
		return;
	}
	struct wlr_keyboard *kb = &g_seat.keyboard_group->keyboard;
	wlr_seat_keyboard_notify_enter(seat, surface, kb->keycodes,
		kb->num_keycodes, &kb->modifiers);
}

void
seat_focus_surface(struct wlr_surface *surface)
{
	/* a layer surface with keyboard focus keeps it */
	if (g_seat.focused_layer) {
		return;
	}
	focus_surface(surface);
}

void
seat_focus_window(struct toplevel *client)
{
	seat_focus_surface(client ? client->get_surface() : nullptr);
}

void
seat_set_focus_layer(struct wlr_layer_surface_v1 *layer)
{
	if (!layer) {
		g_seat.focused_layer = nullptr;
		/* back to the windows */
		seat_focus_window(g_server.workspaces.current().active.get());
		return;
	}
	focus_surface(layer->surface);
	g_seat.focused_layer = layer;
}
