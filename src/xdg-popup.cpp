// SPDX-License-Identifier: GPL-2.0-only
/*
 * Popups of windows. They are drawn with their toplevel through
 * for_each_surface(), so all that is left here is keeping them on the
 * output. Layer surface popups are handled in layers.cpp.
 */

#include <wlr/types/wlr_xdg_shell.h>
#include <wlr/util/log.h>
#include "common/listener.h"
#include "input/cursor.h"
#include "output.h"
#include "xdg.h"

struct xdg_popup : public destroyable {
	struct wlr_xdg_popup *wlr_popup;
	/* root surface coordinates, shared with child popups */
	struct wlr_box constraint_box;

	~xdg_popup();

	DECLARE_HANDLER(xdg_popup, commit);
	DECLARE_HANDLER(xdg_popup, reposition);
	DECLARE_HANDLER(xdg_popup, new_popup);
};

void
xdg_popup::handle_commit(void *)
{
	if (wlr_popup->base->initial_commit) {
		wlr_xdg_popup_unconstrain_from_box(wlr_popup, &constraint_box);
		/* once is enough, later moves come with a reposition */
		on_commit.disconnect();
	}
}

void
xdg_popup::handle_reposition(void *)
{
	wlr_xdg_popup_unconstrain_from_box(wlr_popup, &constraint_box);
}

void
xdg_popup::handle_new_popup(void *data)
{
	xdg_popup_create((struct wlr_xdg_popup *)data, constraint_box);
}

xdg_popup::~xdg_popup()
{
	/* the area it covered must be repainted */
	output_damage_all();
	cursor_update_focus();
}

void
xdg_popup_create(struct wlr_xdg_popup *wlr_popup, struct wlr_box constraint_box)
{
	auto popup = new xdg_popup();
	popup->wlr_popup = wlr_popup;
	popup->constraint_box = constraint_box;

	CONNECT_LISTENER(wlr_popup, popup, destroy);
	CONNECT_LISTENER(wlr_popup->base->surface, popup, commit);
	CONNECT_LISTENER(wlr_popup, popup, reposition);
	CONNECT_LISTENER(wlr_popup->base, popup, new_popup);
}
