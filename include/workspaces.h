/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_WORKSPACES_H
#define STACKWC_WORKSPACES_H

#include <stdint.h>
#include <vector>
#include <wlr/util/box.h>
#include "common/edge.h"
#include "common/refptr.h"
#include "common/str.h"
#include "layout.h"
#include "window.h"

/* An output as seen by a workspace */
struct mapped_output {
	uint32_t id;
	swc_str name;
	/* layout coordinates */
	struct wlr_box box;
	/* box minus layer-shell exclusive zones */
	struct wlr_box usable;
};

struct workspace {
	int index;
	::layout layout;
	/* tiling order */
	std::vector<window> windows;
	weakptr<toplevel> active;
	weakptr<toplevel> previous;
	/* geometry to restore when the fullscreen window leaves fullscreen */
	struct wlr_box fullscreen_restore;
	/* the first entry is the primary output */
	std::vector<mapped_output> outputs;

	window *find(const toplevel *client);
	window *fullscreen_window();
	const mapped_output *primary_output() const;

	/*
	 * Windows bottom to top: tiled, then floating, with the active
	 * floating window last. Only the fullscreen window if there is one.
	 */
	std::vector<window *> stacking_order();
};

/**
 * workspace_best_candidate() - neighbour of @from in @direction
 *
 * A candidate lies in @direction (by centre point) and overlaps @from
 * on the perpendicular axis. The one with the smallest Manhattan
 * distance between centres wins; ties go to the earlier window.
 * Fullscreen windows are never candidates. Returns NULL if none.
 */
window *workspace_best_candidate(workspace &ws, const window &from,
	enum swc_edge direction);

/* Callbacks into the server, NULL in unit tests */
struct workspace_hooks {
	/* keyboard focus should go to @client, which may be NULL */
	void (*focus)(struct toplevel *client);
	/* what is shown on the current workspace changed */
	void (*damage)(void);
};

struct workspace_manager {
	std::vector<workspace> workspaces;
	size_t active_index = 0;
	workspace_hooks hooks = {};

	void init(int count);
	void finish();

	workspace &current();
	window *find_window(const toplevel *client, workspace **ws = nullptr);

	/* New window, tiled at the end of the current workspace */
	void insert_window(toplevel *client);
	void remove_window(toplevel *client);

	/* @index is zero-based. Return false for no-ops. */
	bool move_window_to_workspace(size_t index);
	bool set_active_workspace(size_t index);

	/* Store the centre of the neighbour in @pointer */
	bool change_focus(enum swc_edge direction, struct wlr_point *pointer);
	/* Swap the active window with its neighbour */
	bool move_window(enum swc_edge direction, struct wlr_point *pointer);

	bool set_fullscreen(toplevel *client, bool fullscreen);
	bool toggle_floating(toplevel *client);
	/* Make @client floating at @geo (interactive move/resize) */
	bool place_floating(toplevel *client, struct wlr_box geo);

	/* @client must be on the current workspace or NULL */
	void set_active(toplevel *client);
	toplevel *window_at(double lx, double ly);

	void map_output(uint32_t id, const char *name, struct wlr_box box);
	void unmap_output(uint32_t id);
	void update_output_area(uint32_t id, struct wlr_box usable);

	void relayout(workspace &ws);

private:
	void notify_damage();
	void leave_fullscreen(workspace &ws, window &win);
};

#endif /* STACKWC_WORKSPACES_H */
