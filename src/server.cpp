// SPDX-License-Identifier: GPL-2.0-only
#include <signal.h>
#include <stdlib.h>
#include <wlr/backend/libinput.h>
#include <wlr/backend/multi.h>
#include <wlr/backend/session.h>
#include <wlr/types/wlr_compositor.h>
#include <wlr/types/wlr_data_device.h>
#include <wlr/types/wlr_subcompositor.h>
#include <wlr/util/log.h>
#include "config/rcxml.h"
#include "device.h"
#include "layers.h"
#include "output.h"
#include "stackwc.h"

#define COMPOSITOR_VERSION (6)

static int
handle_sighup(int signal, void *data)
{
	server_reconfigure();
	return 0;
}

static int
handle_sigterm(int signal, void *data)
{
	wl_display_terminate(g_server.wl_display);
	return 0;
}

static void
handle_session_active(struct wl_listener *listener, void *data)
{
	devices_handle_session_active(g_server.session->active);
}

static void
create_backends(void)
{
	g_server.session = wlr_session_create(g_server.wl_event_loop);
	if (!g_server.session) {
		wlr_log(WLR_ERROR, "unable to create session");
		exit(EXIT_FAILURE);
	}

	g_server.backend = wlr_multi_backend_create(g_server.wl_event_loop);
	if (!g_server.backend) {
		wlr_log(WLR_ERROR, "unable to create backend");
		exit(EXIT_FAILURE);
	}

	g_server.libinput_backend = wlr_libinput_backend_create(g_server.session);
	if (!g_server.libinput_backend
			|| !wlr_multi_backend_add(g_server.backend,
				g_server.libinput_backend)) {
		wlr_log(WLR_ERROR, "unable to create libinput backend");
		exit(EXIT_FAILURE);
	}

	g_server.session_active.notify = handle_session_active;
	wl_signal_add(&g_server.session->events.active,
		&g_server.session_active);
}

void
server_init(void)
{
	g_server.wl_display = wl_display_create();
	if (!g_server.wl_display) {
		wlr_log(WLR_ERROR, "cannot allocate a wayland display");
		exit(EXIT_FAILURE);
	}

	/* Increase max client buffer size to make slow clients less likely to terminate */
	wl_display_set_default_max_buffer_size(g_server.wl_display, 1024 * 1024);

	g_server.wl_event_loop = wl_display_get_event_loop(g_server.wl_display);

	/* Catch signals */
	g_server.sighup_source = wl_event_loop_add_signal(
		g_server.wl_event_loop, SIGHUP, handle_sighup, NULL);
	g_server.sigint_source = wl_event_loop_add_signal(
		g_server.wl_event_loop, SIGINT, handle_sigterm, NULL);
	g_server.sigterm_source = wl_event_loop_add_signal(
		g_server.wl_event_loop, SIGTERM, handle_sigterm, NULL);

	g_server.intents.init(g_server.wl_event_loop, devices_handle_intent,
		NULL);

	g_server.workspaces.init(rc.workspace_count);
	g_server.workspaces.hooks = {
		.focus = seat_focus_window,
		.damage = output_damage_all,
	};

	create_backends();

	/*
	 * The renderer belongs to the primary GPU, which may come and go.
	 * The compositor gets it through wlr_compositor_set_renderer().
	 */
	g_server.compositor = wlr_compositor_create(g_server.wl_display,
		COMPOSITOR_VERSION, NULL);
	if (!g_server.compositor) {
		wlr_log(WLR_ERROR, "unable to create the wlroots compositor");
		exit(EXIT_FAILURE);
	}
	if (!wlr_subcompositor_create(g_server.wl_display)) {
		wlr_log(WLR_ERROR, "unable to create the wlroots subcompositor");
		exit(EXIT_FAILURE);
	}
	if (!wlr_data_device_manager_create(g_server.wl_display)) {
		wlr_log(WLR_ERROR, "unable to create data device manager");
		exit(EXIT_FAILURE);
	}

	output_init();
	devices_init();

	xdg_shell_init();
	layers_init();
	seat_init();
}

void
server_start(void)
{
	/* Add a Unix socket to the Wayland display. */
	const char *socket = wl_display_add_socket_auto(g_server.wl_display);
	if (!socket) {
		wlr_log_errno(WLR_ERROR, "unable to open wayland socket");
		exit(EXIT_FAILURE);
	}

	/*
	 * Start the backend. This will enumerate outputs and inputs, become
	 * the DRM master, etc
	 */
	if (!wlr_backend_start(g_server.backend)) {
		wlr_log(WLR_ERROR, "unable to start the wlroots backend");
		exit(EXIT_FAILURE);
	}
	g_server.backend_started = true;

	if (setenv("WAYLAND_DISPLAY", socket, true) < 0) {
		wlr_log_errno(WLR_ERROR, "unable to set WAYLAND_DISPLAY");
	} else {
		wlr_log(WLR_INFO, "WAYLAND_DISPLAY=%s", socket);
	}
}

void
server_finish(void)
{
	wl_display_destroy_clients(g_server.wl_display);

	seat_finish();
	layers_finish();
	xdg_shell_finish();

	/* outputs go with the DRM backends */
	devices_finish();
	output_finish();

	wl_list_remove(&g_server.session_active.link);
	wlr_backend_destroy(g_server.backend);
	g_server.backend = nullptr;
	g_server.libinput_backend = nullptr;

	g_server.workspaces.finish();
	g_server.intents.finish();

	wl_event_source_remove(g_server.sighup_source);
	wl_event_source_remove(g_server.sigint_source);
	wl_event_source_remove(g_server.sigterm_source);

	/* before the event loop goes away with the display */
	wlr_session_destroy(g_server.session);
	g_server.session = nullptr;

	wl_display_destroy(g_server.wl_display);
	g_server.wl_display = nullptr;
}

void
server_reconfigure(void)
{
	wlr_log(WLR_INFO, "reloading configuration");

	/* the workspace count is fixed at startup */
	int workspace_count = rc.workspace_count;
	swc_str config_file = rc.config_file;
	rcxml_read(config_file ? config_file.c() : NULL);
	rc.workspace_count = workspace_count;

	seat_reconfigure();
	for (auto &ws : g_server.workspaces.workspaces) {
		g_server.workspaces.relayout(ws);
	}
	output_damage_all();
}
