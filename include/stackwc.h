/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_H
#define STACKWC_H

#include <vector>
#include <wlr/util/box.h>
#include <wlr/util/log.h>
#include "grab.h"
#include "intent.h"
#include "workspaces.h"

#define XCURSOR_DEFAULT "left_ptr"
#define XCURSOR_SIZE 24

struct drm_device;
struct input;
struct output;
struct wlr_layer_surface_v1;
struct wlr_surface;

enum input_mode {
	SWC_INPUT_STATE_PASSTHROUGH = 0,
	SWC_INPUT_STATE_MOVE,
	SWC_INPUT_STATE_RESIZE,
};

struct seat {
	struct wlr_seat *wlr_seat;
	struct wlr_keyboard_group *keyboard_group;

	struct wlr_cursor *cursor;
	struct wlr_xcursor_manager *xcursor_manager;

	/*
	 * Cursor image set by the client with pointer focus. When NULL,
	 * the default xcursor image is drawn unless cursor_hidden is set
	 * (the client asked for no cursor at all).
	 */
	struct wlr_surface *cursor_surface;
	int32_t cursor_hotspot_x;
	int32_t cursor_hotspot_y;
	bool cursor_hidden;
	struct wl_listener cursor_surface_destroy;

	/* Buttons held, with their serials, to validate move/resize requests */
	pressed_buttons pressed;
	struct grab grab;

	/* if set, windows cannot receive keyboard focus */
	struct wlr_layer_surface_v1 *focused_layer;

	std::vector<input *> inputs;
	struct wl_listener new_input;

	struct {
		struct wl_listener motion;
		struct wl_listener motion_absolute;
		struct wl_listener button;
		struct wl_listener axis;
		struct wl_listener frame;
	} on_cursor;

	struct wl_listener request_set_cursor;
};

struct server {
	struct wl_display *wl_display;
	struct wl_event_loop *wl_event_loop;  /* Can be used for timer events */
	struct wlr_session *session;
	/* multi-backend holding every DRM backend and the libinput backend */
	struct wlr_backend *backend;
	struct wlr_backend *libinput_backend;
	bool backend_started;

	/* Owned by the primary device, NULL while there is none */
	struct wlr_renderer *renderer;
	struct wlr_allocator *allocator;
	/* wl_shm and linux-dmabuf globals are created once, for the first renderer */
	bool renderer_globals_created;

	struct wlr_compositor *compositor;

	struct wl_event_source *sighup_source;
	struct wl_event_source *sigint_source;
	struct wl_event_source *sigterm_source;

	struct wl_listener session_active;
	struct wl_listener add_drm_card;

	struct wlr_xdg_shell *xdg_shell;
	struct wlr_layer_shell_v1 *layer_shell;

	struct wl_listener new_xdg_toplevel;
	struct wl_listener new_layer_surface;
	struct wl_listener new_surface;

	/* cursor interactive */
	enum input_mode input_mode;

	/* primary first */
	std::vector<drm_device *> devices;
	std::vector<output *> outputs;
	struct wlr_output_layout *output_layout;
	uint32_t next_output_id;

	workspace_manager workspaces;
	intent_queue intents;
};

/*
 * Globals
 *
 * Rationale: these are unlikely to ever have more than one instance
 * per process, and need to last for the lifetime of the process.
 * Accessing them indirectly through pointers embedded in every other
 * struct just adds noise to the code.
 */
extern struct seat g_seat;
extern struct server g_server;

void xdg_shell_init(void);
void xdg_shell_finish(void);

/*
 * Topmost surface at a layout position, together with the window it
 * belongs to (NULL for layer surfaces). Windows of the current
 * workspace only.
 */
struct wlr_surface *desktop_surface_at(double lx, double ly, double *sx,
	double *sy, struct toplevel **client);

void seat_init(void);
void seat_finish(void);
void seat_reconfigure(void);
void seat_focus_surface(struct wlr_surface *surface);
/* Keyboard focus for a window, NULL to clear */
void seat_focus_window(struct toplevel *client);
void seat_set_focus_layer(struct wlr_layer_surface_v1 *layer);

void interactive_begin(struct toplevel *client, enum input_mode mode,
	enum swc_edge edges);
void interactive_motion(void);
void interactive_finish(void);
/* End any grab on @client, which is going away */
void interactive_cancel(struct toplevel *client);

void server_init(void);
void server_start(void);
void server_finish(void);
void server_reconfigure(void);

#endif /* STACKWC_H */
