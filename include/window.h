/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_WINDOW_H
#define STACKWC_WINDOW_H

#include <sys/types.h>
#include <wlr/types/wlr_compositor.h>
#include <wlr/util/box.h>
#include "common/refptr.h"

enum window_mode {
	WINDOW_MODE_TILED = 0,
	WINDOW_MODE_FLOATING,
	WINDOW_MODE_FULLSCREEN,
};

/*
 * The client side of a window: the surface handle the workspaces
 * arrange, and the requests they can send back to the client.
 *
 * In stackwc, toplevels are created by the xdg-shell glue (see
 * xdg_toplevel_window in xdg.cpp). Placement state does not live
 * here but in the owning workspace's window table.
 */
struct toplevel : public weak_target<toplevel> {
	virtual ~toplevel() {}

	/* Root surface, may be NULL if there is no wl_surface */
	virtual struct wlr_surface *get_surface() = 0;
	virtual const char *get_app_id() = 0;
	virtual pid_t get_pid() = 0;

	/* Request the given size; the position is compositor-side only */
	virtual void configure(struct wlr_box geo) = 0;
	virtual void close() = 0;
	virtual void set_activated(bool activated) = 0;
	virtual void set_fullscreen(bool fullscreen) = 0;
	virtual void set_resizing(bool resizing) = 0;
	/* Enter or leave every output (workspace switch) */
	virtual void set_visible(bool visible) = 0;

	/*
	 * Iterate the root surface, its subsurfaces and popups. Surface
	 * coordinates are relative to the window geometry origin.
	 */
	virtual void for_each_surface(wlr_surface_iterator_func_t iterator,
		void *user_data) = 0;

	/* Surface at a point relative to the window geometry origin */
	virtual struct wlr_surface *surface_at(double wx, double wy,
		double *sx, double *sy) = 0;
};

/* One row of a workspace's window table */
struct window {
	struct toplevel *client;
	enum window_mode mode;
	/* layout coordinates, excluding the border */
	struct wlr_box geometry;
	/* mode to return to when leaving fullscreen */
	enum window_mode restore_mode;
};

const char *window_mode_name(enum window_mode mode);

#endif /* STACKWC_WINDOW_H */
