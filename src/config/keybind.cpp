// SPDX-License-Identifier: GPL-2.0-only
#include "config/keybind.h"
#include <glib.h>
#include <string.h>
#include <wlr/types/wlr_keyboard.h>
#include <wlr/util/log.h>
#include "common/alg.h"

static const struct {
	const char *name;
	const char *alias;
	uint32_t modifier;
} modifier_names[] = {
	{ "S", nullptr, WLR_MODIFIER_SHIFT },
	{ "C", nullptr, WLR_MODIFIER_CTRL },
	{ "A", "Mod1", WLR_MODIFIER_ALT },
	{ "W", "Mod4", WLR_MODIFIER_LOGO },
	{ "M", "Mod5", WLR_MODIFIER_MOD5 },
};

uint32_t
parse_modifier(const char *symname)
{
	for (auto &m : modifier_names) {
		if (!strcmp(symname, m.name)
				|| (m.alias && !strcmp(symname, m.alias))) {
			return m.modifier;
		}
	}
	return 0;
}

bool
keybind_the_same(const keybind &a, const keybind &b)
{
	return a.modifiers == b.modifiers && a.keysyms == b.keysyms;
}

bool
keybind_matches(const keybind &keybind, uint32_t modifiers, xkb_keysym_t sym)
{
	if (keybind.modifiers != modifiers) {
		return false;
	}
	return swc::contains(keybind.keysyms, xkb_keysym_to_lower(sym));
}

keybind *
keybind_append_new(std::vector<keybind> &keybinds, const char *keybind)
{
	::keybind k{};
	gchar **symnames = g_strsplit(keybind, "-", -1);
	for (size_t i = 0; symnames[i]; i++) {
		const char *symname = symnames[i];
		/*
		 * "W--" splits into "W", "", "": a pair of empty tokens
		 * stands for one literal "-"
		 */
		if (!symname[0]) {
			if (symnames[i + 1] && !symnames[i + 1][0]) {
				continue;
			}
			symname = "-";
		}
		uint32_t modifier = parse_modifier(symname);
		if (modifier != 0) {
			k.modifiers |= modifier;
			continue;
		}
		xkb_keysym_t sym = xkb_keysym_from_name(symname,
			XKB_KEYSYM_CASE_INSENSITIVE);
		sym = xkb_keysym_to_lower(sym);
		if (sym == XKB_KEY_NoSymbol) {
			wlr_log(WLR_ERROR, "unknown keybind (%s)", symname);
			g_strfreev(symnames);
			return nullptr;
		}
		k.keysyms.push_back(sym);
	}
	g_strfreev(symnames);
	keybinds.push_back(std::move(k));
	return &keybinds.back();
}
