// SPDX-License-Identifier: GPL-2.0-only

#include <assert.h>
#include <stdlib.h>
#include <wlr/types/wlr_cursor.h>
#include <wlr/types/wlr_output_layout.h>
#include <wlr/types/wlr_xdg_shell.h>
#include <wlr/util/log.h>
#include "common/listener.h"
#include "input/cursor.h"
#include "layers.h"
#include "output.h"
#include "stackwc.h"
#include "window.h"
#include "workspaces.h"
#include "xdg.h"

#define SWC_XDG_SHELL_VERSION 6
#define CONFIGURE_TIMEOUT_MS 100

struct xdg_toplevel_window : public toplevel, public destroyable {
	struct wlr_xdg_surface *xdg_surface;
	struct wlr_xdg_toplevel *xdg_toplevel;
	bool mapped = false;

	/* last size sent to the client */
	struct wlr_box pending = {};
	uint32_t pending_configure_serial = 0;
	struct wl_event_source *pending_configure_timeout = nullptr;

	/* extent painted last, layout coordinates */
	struct wlr_box painted = {};

	xdg_toplevel_window(struct wlr_xdg_toplevel *xdg_toplevel)
		: xdg_surface(xdg_toplevel->base), xdg_toplevel(xdg_toplevel) {}
	~xdg_toplevel_window();

	struct wlr_surface *get_surface() override;
	const char *get_app_id() override;
	pid_t get_pid() override;
	void configure(struct wlr_box geo) override;
	void close() override;
	void set_activated(bool activated) override;
	void set_fullscreen(bool fullscreen) override;
	void set_resizing(bool resizing) override;
	void set_visible(bool visible) override;
	void for_each_surface(wlr_surface_iterator_func_t iterator,
		void *user_data) override;
	struct wlr_surface *surface_at(double wx, double wy, double *sx,
		double *sy) override;

	DECLARE_HANDLER(xdg_toplevel_window, map);
	DECLARE_HANDLER(xdg_toplevel_window, unmap);
	DECLARE_HANDLER(xdg_toplevel_window, commit);
	DECLARE_HANDLER(xdg_toplevel_window, request_move);
	DECLARE_HANDLER(xdg_toplevel_window, request_resize);
	DECLARE_HANDLER(xdg_toplevel_window, request_fullscreen);
	DECLARE_HANDLER(xdg_toplevel_window, new_popup);
};

static struct xdg_toplevel_window *
window_from_wlr_surface(struct wlr_surface *surface)
{
	struct wlr_xdg_toplevel *xdg_toplevel =
		wlr_xdg_toplevel_try_from_wlr_surface(surface);
	if (!xdg_toplevel) {
		return nullptr;
	}
	return (struct xdg_toplevel_window *)xdg_toplevel->base->data;
}

struct wlr_surface *
xdg_toplevel_window::get_surface()
{
	return xdg_surface->surface;
}

const char *
xdg_toplevel_window::get_app_id()
{
	return xdg_toplevel->app_id ? xdg_toplevel->app_id : "";
}

pid_t
xdg_toplevel_window::get_pid()
{
	pid_t pid = -1;
	struct wlr_surface *surface = xdg_surface->surface;
	if (surface && surface->resource) {
		struct wl_client *client = wl_resource_get_client(surface->resource);
		wl_client_get_credentials(client, &pid, nullptr, nullptr);
	}
	return pid;
}

static int
handle_configure_timeout(void *data)
{
	auto window = (struct xdg_toplevel_window *)data;
	assert(window->pending_configure_serial > 0);
	assert(window->pending_configure_timeout);

	wlr_log(WLR_INFO, "client (%s) did not respond to configure request "
		"in %d ms", window->get_app_id(), CONFIGURE_TIMEOUT_MS);

	wl_event_source_remove(window->pending_configure_timeout);
	window->pending_configure_serial = 0;
	window->pending_configure_timeout = nullptr;

	/* the old buffer stays where the window is now */
	output_damage_all();
	return 0; /* ignored per wl_event_loop docs */
}

static void
set_pending_configure_serial(struct xdg_toplevel_window *window,
		uint32_t serial)
{
	window->pending_configure_serial = serial;
	if (!window->pending_configure_timeout) {
		window->pending_configure_timeout =
			wl_event_loop_add_timer(g_server.wl_event_loop,
				handle_configure_timeout, window);
	}
	wl_event_source_timer_update(window->pending_configure_timeout,
		CONFIGURE_TIMEOUT_MS);
}

void
xdg_toplevel_window::configure(struct wlr_box geo)
{
	uint32_t serial = 0;

	/*
	 * Wayland has no notion of a global position, so only a size
	 * change needs a configure request.
	 */
	if (geo.width != pending.width || geo.height != pending.height) {
		if (xdg_surface->initialized) {
			serial = wlr_xdg_toplevel_set_size(xdg_toplevel,
				geo.width, geo.height);
		} else {
			wlr_log(WLR_DEBUG, "Preventing configure of "
				"uninitialized surface");
		}
	}

	pending = geo;
	if (serial > 0) {
		set_pending_configure_serial(this, serial);
	}
}

void
xdg_toplevel_window::close()
{
	wlr_xdg_toplevel_send_close(xdg_toplevel);
}

void
xdg_toplevel_window::set_activated(bool activated)
{
	if (!xdg_surface->initialized) {
		wlr_log(WLR_DEBUG, "Prevented activating a non-intialized window");
		return;
	}
	uint32_t serial = wlr_xdg_toplevel_set_activated(xdg_toplevel,
		activated);
	if (serial > 0) {
		set_pending_configure_serial(this, serial);
	}
}

void
xdg_toplevel_window::set_fullscreen(bool fullscreen)
{
	if (!xdg_surface->initialized) {
		wlr_log(WLR_DEBUG, "Prevented fullscreening a non-intialized window");
		return;
	}
	uint32_t serial = wlr_xdg_toplevel_set_fullscreen(xdg_toplevel,
		fullscreen);
	if (serial > 0) {
		set_pending_configure_serial(this, serial);
	}
}

void
xdg_toplevel_window::set_resizing(bool resizing)
{
	if (!xdg_surface->initialized) {
		return;
	}
	uint32_t serial = wlr_xdg_toplevel_set_resizing(xdg_toplevel,
		resizing);
	if (serial > 0) {
		set_pending_configure_serial(this, serial);
	}
}

static void
enter_iterator(struct wlr_surface *surface, int sx, int sy, void *data)
{
	output_enter_all(surface);
}

static void
leave_iterator(struct wlr_surface *surface, int sx, int sy, void *data)
{
	output_leave_all(surface);
}

void
xdg_toplevel_window::set_visible(bool visible)
{
	if (!mapped) {
		return;
	}
	for_each_surface(visible ? enter_iterator : leave_iterator, nullptr);
}

struct geometry_iterator_data {
	wlr_surface_iterator_func_t iterator;
	void *user_data;
	int x;
	int y;
};

static void
geometry_iterator(struct wlr_surface *surface, int sx, int sy, void *data)
{
	auto d = (struct geometry_iterator_data *)data;
	d->iterator(surface, sx - d->x, sy - d->y, d->user_data);
}

void
xdg_toplevel_window::for_each_surface(wlr_surface_iterator_func_t iterator,
		void *user_data)
{
	struct geometry_iterator_data data = {
		.iterator = iterator,
		.user_data = user_data,
		.x = xdg_surface->geometry.x,
		.y = xdg_surface->geometry.y,
	};
	wlr_xdg_surface_for_each_surface(xdg_surface, geometry_iterator, &data);
}

struct wlr_surface *
xdg_toplevel_window::surface_at(double wx, double wy, double *sx, double *sy)
{
	return wlr_xdg_surface_surface_at(xdg_surface,
		wx + xdg_surface->geometry.x, wy + xdg_surface->geometry.y,
		sx, sy);
}

/* Layout rectangle covered by the root surface, subsurfaces aside */
static struct wlr_box
surface_extent(struct xdg_toplevel_window *window, const struct window *row)
{
	struct wlr_surface *surface = window->xdg_surface->surface;
	struct wlr_box extent = {
		.x = row->geometry.x - window->xdg_surface->geometry.x,
		.y = row->geometry.y - window->xdg_surface->geometry.y,
		.width = surface->current.width,
		.height = surface->current.height,
	};
	return extent;
}

void
xdg_toplevel_window::handle_commit(void *)
{
	if (xdg_surface->initial_commit) {
		uint32_t serial = wlr_xdg_surface_schedule_configure(xdg_surface);
		if (serial > 0) {
			set_pending_configure_serial(this, serial);
		}

		wlr_xdg_toplevel_set_wm_capabilities(xdg_toplevel,
			WLR_XDG_TOPLEVEL_WM_CAPABILITIES_FULLSCREEN);

		struct output *output = output_nearest_to_cursor();
		if (output) {
			wlr_xdg_toplevel_set_bounds(xdg_toplevel,
				output->usable_area.width,
				output->usable_area.height);
		}
		return;
	}

	uint32_t serial = pending_configure_serial;
	if (serial > 0 && serial == xdg_surface->current.configure_serial) {
		assert(pending_configure_timeout);
		wl_event_source_remove(pending_configure_timeout);
		pending_configure_serial = 0;
		pending_configure_timeout = nullptr;
	}
}

struct find_surface_data {
	struct wlr_surface *surface;
	bool found;
	int sx;
	int sy;
};

static void
find_surface_iterator(struct wlr_surface *surface, int sx, int sy, void *data)
{
	auto d = (struct find_surface_data *)data;
	if (surface == d->surface) {
		d->found = true;
		d->sx = sx;
		d->sy = sy;
	}
}

bool
xdg_damage_surface(struct wlr_surface *surface)
{
	struct xdg_toplevel_window *xdg_window =
		window_from_wlr_surface(wlr_surface_get_root_surface(surface));
	if (!xdg_window) {
		return false;
	}

	workspace *ws = nullptr;
	struct window *row = g_server.workspaces.find_window(xdg_window, &ws);
	if (!row || ws != &g_server.workspaces.current()) {
		/* not shown */
		return true;
	}

	struct find_surface_data data = { .surface = surface };
	xdg_window->for_each_surface(find_surface_iterator, &data);
	if (data.found) {
		output_damage_surface(surface, row->geometry.x + data.sx,
			row->geometry.y + data.sy);
	}

	struct wlr_box extent = surface_extent(xdg_window, row);
	if (extent.width != xdg_window->painted.width
			|| extent.height != xdg_window->painted.height
			|| extent.x != xdg_window->painted.x
			|| extent.y != xdg_window->painted.y) {
		output_damage_layout_box(xdg_window->painted);
		output_damage_layout_box(extent);
		xdg_window->painted = extent;
	}
	return true;
}

void
xdg_windows_enter_outputs(void)
{
	if (g_server.workspaces.workspaces.empty()) {
		return;
	}
	for (auto &win : g_server.workspaces.current().windows) {
		win.client->set_visible(true);
	}
}

xdg_toplevel_window::~xdg_toplevel_window()
{
	struct wlr_xdg_popup *popup, *tmp;
	wl_list_for_each_safe(popup, tmp, &xdg_surface->popups, link) {
		wlr_xdg_popup_destroy(popup);
	}

	interactive_cancel(this);
	g_server.workspaces.remove_window(this);
	xdg_surface->data = nullptr;

	if (pending_configure_timeout) {
		wl_event_source_remove(pending_configure_timeout);
		pending_configure_timeout = nullptr;
	}
}

void
xdg_toplevel_window::handle_map(void *)
{
	if (mapped) {
		return;
	}
	mapped = true;
	wlr_log(WLR_DEBUG, "mapping window (%s)", get_app_id());

	g_server.workspaces.insert_window(this);
	set_visible(true);

	if (xdg_toplevel->requested.fullscreen) {
		g_server.workspaces.set_fullscreen(this, true);
	}
	cursor_update_focus();
}

void
xdg_toplevel_window::handle_unmap(void *)
{
	if (!mapped) {
		return;
	}
	mapped = false;

	interactive_cancel(this);
	g_server.workspaces.remove_window(this);
	painted = {};
	/* whatever is under the pointer now gets focus */
	cursor_update_focus();
}

/* Move and resize requests come with the serial of a button press */
static bool
validate_request(struct xdg_toplevel_window *window, uint32_t serial,
		const char *request)
{
	if (!window->mapped) {
		return false;
	}
	if (!g_seat.pressed.validate(serial)) {
		wlr_log(WLR_DEBUG, "dropping %s request of (%s) with stale "
			"serial %u", request, window->get_app_id(), serial);
		return false;
	}
	return true;
}

void
xdg_toplevel_window::handle_request_move(void *data)
{
	auto event = (struct wlr_xdg_toplevel_move_event *)data;
	if (validate_request(this, event->serial, "move")) {
		interactive_begin(this, SWC_INPUT_STATE_MOVE, SWC_EDGE_NONE);
	}
}

void
xdg_toplevel_window::handle_request_resize(void *data)
{
	auto event = (struct wlr_xdg_toplevel_resize_event *)data;
	if (validate_request(this, event->serial, "resize")) {
		interactive_begin(this, SWC_INPUT_STATE_RESIZE,
			(enum swc_edge)event->edges);
	}
}

void
xdg_toplevel_window::handle_request_fullscreen(void *)
{
	/*
	 * Before the initial commit or the first map, the map handler
	 * takes care of it.
	 */
	if (!xdg_surface->initialized || !mapped) {
		return;
	}
	bool fullscreen = xdg_toplevel->requested.fullscreen;
	if (!g_server.workspaces.set_fullscreen(this, fullscreen)) {
		/* an xdg_toplevel request must be answered with a configure */
		wlr_xdg_surface_schedule_configure(xdg_surface);
	}
}

void
xdg_toplevel_window::handle_new_popup(void *data)
{
	auto wlr_popup = (struct wlr_xdg_popup *)data;

	window *row = g_server.workspaces.find_window(this);
	struct output *output = nullptr;
	if (row) {
		output = output_at(row->geometry.x + row->geometry.width / 2,
			row->geometry.y + row->geometry.height / 2);
	}
	if (!output) {
		output = output_nearest_to_cursor();
	}
	if (!output) {
		wlr_xdg_popup_destroy(wlr_popup);
		return;
	}

	/* the output, relative to the toplevel surface */
	struct wlr_box output_box = output_layout_box(output);
	struct wlr_box origin = row ? row->geometry : output_box;
	struct wlr_box constraint = {
		.x = output_box.x - origin.x + xdg_surface->geometry.x,
		.y = output_box.y - origin.y + xdg_surface->geometry.y,
		.width = output_box.width,
		.height = output_box.height,
	};
	xdg_popup_create(wlr_popup, constraint);
}

/* wlr_xdg_surface->data points to the window */
static void
handle_new_xdg_toplevel(struct wl_listener *listener, void *data)
{
	auto xdg_toplevel = (struct wlr_xdg_toplevel *)data;
	struct wlr_xdg_surface *xdg_surface = xdg_toplevel->base;
	assert(xdg_surface->role == WLR_XDG_SURFACE_ROLE_TOPLEVEL);

	auto window = new xdg_toplevel_window(xdg_toplevel);
	xdg_surface->data = window;

	CONNECT_LISTENER(xdg_toplevel, window, destroy);
	CONNECT_LISTENER(xdg_toplevel, window, request_move);
	CONNECT_LISTENER(xdg_toplevel, window, request_resize);
	CONNECT_LISTENER(xdg_toplevel, window, request_fullscreen);
	CONNECT_LISTENER(xdg_surface->surface, window, map);
	CONNECT_LISTENER(xdg_surface->surface, window, unmap);
	CONNECT_LISTENER(xdg_surface->surface, window, commit);
	CONNECT_LISTENER(xdg_surface, window, new_popup);
}

struct wlr_surface *
desktop_surface_at(double lx, double ly, double *sx, double *sy,
		struct toplevel **client)
{
	*client = nullptr;
	struct output *output = output_at(lx, ly);
	workspace &ws = g_server.workspaces.current();
	bool fullscreen = ws.fullscreen_window();

	/* panels and the like stay under a fullscreen window */
	if (output && !fullscreen) {
		struct wlr_surface *surface = layers_surface_at(output,
			/* upper */ true, lx, ly, sx, sy);
		if (surface) {
			return surface;
		}
	}

	auto order = ws.stacking_order();
	for (auto it = order.rbegin(); it != order.rend(); ++it) {
		window *win = *it;
		struct wlr_surface *surface = win->client->surface_at(
			lx - win->geometry.x, ly - win->geometry.y, sx, sy);
		if (surface) {
			*client = win->client;
			return surface;
		}
	}

	if (output) {
		return layers_surface_at(output, /* upper */ false, lx, ly, sx, sy);
	}
	return nullptr;
}

void
xdg_shell_init(void)
{
	g_server.xdg_shell = wlr_xdg_shell_create(g_server.wl_display,
		SWC_XDG_SHELL_VERSION);
	if (!g_server.xdg_shell) {
		wlr_log(WLR_ERROR, "unable to create the XDG shell interface");
		exit(EXIT_FAILURE);
	}

	g_server.new_xdg_toplevel.notify = handle_new_xdg_toplevel;
	wl_signal_add(&g_server.xdg_shell->events.new_toplevel,
		&g_server.new_xdg_toplevel);
}

void
xdg_shell_finish(void)
{
	wl_list_remove(&g_server.new_xdg_toplevel.link);
}
