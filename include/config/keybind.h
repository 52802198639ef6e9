/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_KEYBIND_H
#define STACKWC_KEYBIND_H

#include <stdint.h>
#include <vector>
#include <xkbcommon/xkbcommon.h>
#include "action.h"

struct keybind {
	uint32_t modifiers;
	std::vector<xkb_keysym_t> keysyms;
	std::vector<action> actions;
};

/**
 * keybind_append_new - parse a key combination and add it to the list
 * @keybinds: list to append to
 * @keybind: key combination, e.g. "W-S-Return"
 *
 * Returns NULL (and appends nothing) if a key name is unknown.
 */
keybind *keybind_append_new(std::vector<keybind> &keybinds,
	const char *keybind);

/* "S", "C", "A"/"Mod1", "W"/"Mod4" or "M"/"Mod5", 0 for anything else */
uint32_t parse_modifier(const char *symname);

bool keybind_the_same(const keybind &a, const keybind &b);

/*
 * True if @keybind is triggered by @sym with exactly @modifiers held.
 * @sym is compared case-insensitively.
 */
bool keybind_matches(const keybind &keybind, uint32_t modifiers,
	xkb_keysym_t sym);

#endif /* STACKWC_KEYBIND_H */
