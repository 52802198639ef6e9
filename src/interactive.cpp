// SPDX-License-Identifier: GPL-2.0-only
#include <wlr/types/wlr_cursor.h>
#include <wlr/types/wlr_seat.h>
#include <wlr/util/log.h>
#include "grab.h"
#include "input/cursor.h"
#include "stackwc.h"
#include "window.h"

/*
 * Start a move or resize of @client, which makes it floating. With
 * SWC_EDGE_NONE, a resize takes the edges nearest to the pointer.
 */
void
interactive_begin(struct toplevel *client, enum input_mode mode,
		enum swc_edge edges)
{
	if (g_server.input_mode != SWC_INPUT_STATE_PASSTHROUGH) {
		return;
	}

	workspace *ws = nullptr;
	window *win = g_server.workspaces.find_window(client, &ws);
	if (!win || ws != &g_server.workspaces.current()) {
		return;
	}
	if (win->mode == WINDOW_MODE_FULLSCREEN) {
		wlr_log(WLR_DEBUG, "no move or resize of fullscreen %s",
			client->get_app_id());
		return;
	}

	double px = g_seat.cursor->x;
	double py = g_seat.cursor->y;
	switch (mode) {
	case SWC_INPUT_STATE_MOVE:
		grab_begin_move(g_seat.grab, client, win->geometry, px, py);
		break;
	case SWC_INPUT_STATE_RESIZE:
		if (edges == SWC_EDGE_NONE) {
			edges = grab_edges_at(win->geometry, px, py);
		}
		grab_begin_resize(g_seat.grab, client, win->geometry, edges,
			px, py);
		client->set_resizing(true);
		break;
	default:
		return;
	}
	g_server.input_mode = mode;

	wlr_log(WLR_DEBUG, "%s of %s started",
		mode == SWC_INPUT_STATE_MOVE ? "move" : "resize",
		client->get_app_id());

	/* the pointer belongs to the grab until the buttons are released */
	wlr_seat_pointer_notify_clear_focus(g_seat.wlr_seat);
	cursor_reset_image();

	struct wlr_box geo = grab_motion(g_seat.grab, px, py);
	if (grab_detaches(g_seat.grab, geo)) {
		g_server.workspaces.place_floating(client, geo);
	}
}

void
interactive_motion(void)
{
	struct toplevel *client;
	if (!g_seat.grab.client.check(client)) {
		interactive_finish();
		return;
	}
	struct wlr_box geo = grab_motion(g_seat.grab, g_seat.cursor->x,
		g_seat.cursor->y);
	window *win = g_server.workspaces.find_window(client);
	if (win && win->mode == WINDOW_MODE_TILED
			&& !grab_detaches(g_seat.grab, geo)) {
		return;
	}
	g_server.workspaces.place_floating(client, geo);
}

static void
end_grab(bool notify_client)
{
	if (g_server.input_mode == SWC_INPUT_STATE_PASSTHROUGH) {
		return;
	}
	struct toplevel *client;
	if (notify_client && g_seat.grab.mode == GRAB_RESIZE
			&& g_seat.grab.client.check(client)) {
		client->set_resizing(false);
	}
	grab_end(g_seat.grab);
	g_server.input_mode = SWC_INPUT_STATE_PASSTHROUGH;
}

void
interactive_finish(void)
{
	end_grab(/* notify_client */ true);
	cursor_update_focus();
}

void
interactive_cancel(struct toplevel *client)
{
	if (g_seat.grab.client == client) {
		end_grab(/* notify_client */ false);
	}
}
