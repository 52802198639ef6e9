// SPDX-License-Identifier: GPL-2.0-only
#include "input/input.h"
#include <wlr/backend.h>
#include <wlr/types/wlr_cursor.h>
#include <wlr/types/wlr_input_device.h>
#include <wlr/types/wlr_keyboard.h>
#include <wlr/types/wlr_keyboard_group.h>
#include <wlr/types/wlr_seat.h>
#include <wlr/util/log.h>
#include "common/alg.h"
#include "input/cursor.h"
#include "input/keyboard.h"
#include "stackwc.h"

/* The pointer capability stays on so clients always get a cursor */
static void
update_capabilities(void)
{
	uint32_t caps = WL_SEAT_CAPABILITY_POINTER;
	bool has_keyboard = swc::find_if(g_seat.inputs, [](struct input *in) {
		return in->wlr_input_device->type == WLR_INPUT_DEVICE_KEYBOARD;
	}) != g_seat.inputs.end();
	if (has_keyboard) {
		caps |= WL_SEAT_CAPABILITY_KEYBOARD;
	}
	wlr_seat_set_capabilities(g_seat.wlr_seat, caps);
}

input::~input()
{
	swc::remove(g_seat.inputs, this);
	if (g_seat.wlr_seat) {
		update_capabilities();
	}
}

static struct input *
create_keyboard(struct wlr_input_device *device)
{
	auto keyboard = new struct keyboard();
	keyboard->wlr_keyboard = wlr_keyboard_from_input_device(device);
	keyboard_configure(keyboard->wlr_keyboard);
	if (!wlr_keyboard_group_add_keyboard(g_seat.keyboard_group,
			keyboard->wlr_keyboard)) {
		wlr_log(WLR_ERROR, "keyboard %s has a different keymap, "
			"its keys are ignored", device->name);
	}
	return keyboard;
}

static void
handle_new_input(struct wl_listener *listener, void *data)
{
	auto device = (struct wlr_input_device *)data;
	struct input *input;

	if (device->type == WLR_INPUT_DEVICE_KEYBOARD) {
		input = create_keyboard(device);
	} else if (device->type == WLR_INPUT_DEVICE_POINTER) {
		input = new struct input();
		wlr_cursor_attach_input_device(g_seat.cursor, device);
	} else {
		wlr_log(WLR_INFO, "ignoring input device %s", device->name);
		return;
	}

	wlr_log(WLR_INFO, "new input device %s", device->name);
	input->wlr_input_device = device;
	CONNECT_LISTENER(device, input, destroy);
	g_seat.inputs.push_back(input);
	update_capabilities();
}

void
inputs_init(void)
{
	cursor_init();
	keyboard_group_init();

	g_seat.new_input.notify = handle_new_input;
	wl_signal_add(&g_server.backend->events.new_input, &g_seat.new_input);
	update_capabilities();
}

void
inputs_finish(void)
{
	wl_list_remove(&g_seat.new_input.link);
	/* normally the backend destroys them first */
	while (!g_seat.inputs.empty()) {
		delete g_seat.inputs.back();
	}
	cursor_finish();
	keyboard_group_finish();
}
