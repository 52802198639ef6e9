// SPDX-License-Identifier: GPL-2.0-only
#include "input/keyboard.h"
#include <stdlib.h>
#include <wlr/backend/session.h>
#include <wlr/types/wlr_keyboard.h>
#include <wlr/types/wlr_keyboard_group.h>
#include <wlr/types/wlr_seat.h>
#include <wlr/util/log.h>
#include "action.h"
#include "common/alg.h"
#include "config/keybind.h"
#include "config/rcxml.h"
#include "stackwc.h"

static struct wl_listener group_key;
static struct wl_listener group_modifiers;

/* keys that triggered a keybind, whose release the client must not see */
static std::vector<uint32_t> bound_keycodes;

uint32_t
keyboard_get_all_modifiers(void)
{
	return wlr_keyboard_get_modifiers(&g_seat.keyboard_group->keyboard);
}

static void
handle_modifiers(struct wl_listener *listener, void *data)
{
	struct wlr_keyboard *wlr_keyboard = &g_seat.keyboard_group->keyboard;
	wlr_seat_set_keyboard(g_seat.wlr_seat, wlr_keyboard);
	wlr_seat_keyboard_notify_modifiers(g_seat.wlr_seat,
		&wlr_keyboard->modifiers);
}

static bool
handle_vt_switch(xkb_keysym_t sym)
{
	if (sym < XKB_KEY_XF86Switch_VT_1 || sym > XKB_KEY_XF86Switch_VT_12) {
		return false;
	}
	if (g_server.session) {
		unsigned int vt = sym - XKB_KEY_XF86Switch_VT_1 + 1;
		wlr_session_change_vt(g_server.session, vt);
	}
	return true;
}

static bool
handle_keybinding(uint32_t modifiers, const xkb_keysym_t *syms, int nsyms)
{
	for (int i = 0; i < nsyms; i++) {
		if (handle_vt_switch(syms[i])) {
			return true;
		}
	}
	/* no compositor shortcuts in the middle of a move or resize */
	if (g_server.input_mode != SWC_INPUT_STATE_PASSTHROUGH) {
		return false;
	}
	for (auto &keybind : rc.keybinds) {
		for (int i = 0; i < nsyms; i++) {
			if (keybind_matches(keybind, modifiers, syms[i])) {
				actions_run(nullptr, keybind.actions);
				return true;
			}
		}
	}
	return false;
}

static void
handle_key(struct wl_listener *listener, void *data)
{
	auto event = (struct wlr_keyboard_key_event *)data;
	struct wlr_keyboard *wlr_keyboard = &g_seat.keyboard_group->keyboard;

	/* libinput keycode to xkbcommon */
	uint32_t keycode = event->keycode + 8;

	if (event->state == WL_KEYBOARD_KEY_STATE_RELEASED) {
		if (swc::contains(bound_keycodes, keycode)) {
			swc::remove(bound_keycodes, keycode);
			return;
		}
	} else {
		const xkb_keysym_t *syms;
		int nsyms = xkb_state_key_get_syms(wlr_keyboard->xkb_state,
			keycode, &syms);
		uint32_t modifiers = wlr_keyboard_get_modifiers(wlr_keyboard);
		if (handle_keybinding(modifiers, syms, nsyms)) {
			bound_keycodes.push_back(keycode);
			return;
		}
	}

	wlr_seat_set_keyboard(g_seat.wlr_seat, wlr_keyboard);
	wlr_seat_keyboard_notify_key(g_seat.wlr_seat, event->time_msec,
		event->keycode, event->state);
}

void
keyboard_configure(struct wlr_keyboard *kb)
{
	struct xkb_rule_names rules = {};
	if (rc.kb_layout) {
		rules.layout = rc.kb_layout.c();
	}

	struct xkb_context *context = xkb_context_new(XKB_CONTEXT_NO_FLAGS);
	struct xkb_keymap *keymap = xkb_keymap_new_from_names(context, &rules,
		XKB_KEYMAP_COMPILE_NO_FLAGS);
	if (!keymap) {
		wlr_log(WLR_ERROR, "unable to compile keymap for layout '%s', "
			"using the XKB defaults", rc.kb_layout.c());
		keymap = xkb_keymap_new_from_names(context, nullptr,
			XKB_KEYMAP_COMPILE_NO_FLAGS);
	}
	if (keymap) {
		if (!wlr_keyboard_keymaps_match(kb->keymap, keymap)) {
			wlr_keyboard_set_keymap(kb, keymap);
		}
		xkb_keymap_unref(keymap);
	} else {
		wlr_log(WLR_ERROR, "unable to compile any keymap");
	}
	xkb_context_unref(context);

	wlr_keyboard_set_repeat_info(kb, rc.repeat_rate, rc.repeat_delay);
}

void
keyboard_group_init(void)
{
	if (g_seat.keyboard_group) {
		return;
	}
	g_seat.keyboard_group = wlr_keyboard_group_create();
	if (!g_seat.keyboard_group) {
		wlr_log(WLR_ERROR, "unable to create keyboard group");
		exit(EXIT_FAILURE);
	}
	struct wlr_keyboard *wlr_keyboard = &g_seat.keyboard_group->keyboard;
	keyboard_configure(wlr_keyboard);
	wlr_seat_set_keyboard(g_seat.wlr_seat, wlr_keyboard);

	group_key.notify = handle_key;
	wl_signal_add(&wlr_keyboard->events.key, &group_key);
	group_modifiers.notify = handle_modifiers;
	wl_signal_add(&wlr_keyboard->events.modifiers, &group_modifiers);
}

void
keyboard_group_finish(void)
{
	if (!g_seat.keyboard_group) {
		return;
	}
	wl_list_remove(&group_key.link);
	wl_list_remove(&group_modifiers.link);
	wlr_keyboard_group_destroy(g_seat.keyboard_group);
	g_seat.keyboard_group = nullptr;
	bound_keycodes.clear();
}
