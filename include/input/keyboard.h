/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_KEYBOARD_H
#define STACKWC_KEYBOARD_H

#include <stdbool.h>
#include <stdint.h>
#include <xkbcommon/xkbcommon.h>
#include "input/input.h"

/*
 * Key events are read from g_seat.keyboard_group, which every physical
 * keyboard joins on creation.
 */
struct keyboard : public input {
	struct wlr_keyboard *wlr_keyboard = nullptr;
};

/* Apply rc.xml layout and repeat settings */
void keyboard_configure(struct wlr_keyboard *kb);

void keyboard_group_init(void);
void keyboard_group_finish(void);

/* Modifiers currently held on the group keyboard */
uint32_t keyboard_get_all_modifiers(void);

#endif /* STACKWC_KEYBOARD_H */
