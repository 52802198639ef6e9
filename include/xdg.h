/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_XDG_H
#define STACKWC_XDG_H

#include <wlr/util/box.h>

struct wlr_surface;
struct wlr_xdg_popup;

/*
 * Track @wlr_popup and its children until they are destroyed.
 * @constraint_box is the area the popup must stay inside, in the
 * coordinate system of the popup's root surface.
 */
void xdg_popup_create(struct wlr_xdg_popup *wlr_popup,
	struct wlr_box constraint_box);

/*
 * Damage the effective damage of @surface if it belongs to a window.
 * Returns false if @surface is not part of a window.
 */
bool xdg_damage_surface(struct wlr_surface *surface);

/* Re-send wl_surface.enter after an output appeared */
void xdg_windows_enter_outputs(void);

#endif /* STACKWC_XDG_H */
