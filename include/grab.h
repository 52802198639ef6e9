/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_GRAB_H
#define STACKWC_GRAB_H

#include <stdint.h>
#include <vector>
#include <wlr/util/box.h>
#include "common/edge.h"
#include "common/refptr.h"
#include "window.h"

#define GRAB_MIN_SIZE 100

enum grab_mode {
	GRAB_NONE = 0,
	GRAB_MOVE,
	GRAB_RESIZE,
};

struct grab {
	enum grab_mode mode = GRAB_NONE;
	weakptr<toplevel> client;
	/* pointer position when the grab started */
	double pointer_x = 0;
	double pointer_y = 0;
	/* window geometry when the grab started */
	struct wlr_box start = {};
	/* resize only */
	enum swc_edge edges = SWC_EDGE_NONE;
};

/*
 * The window is re-centred under the pointer: its start location is
 * the pointer position minus half its size.
 */
void grab_begin_move(grab &grab, toplevel *client, struct wlr_box geo,
	double px, double py);
void grab_begin_resize(grab &grab, toplevel *client, struct wlr_box geo,
	enum swc_edge edges, double px, double py);

/**
 * grab_motion() - window geometry for the pointer at (@px, @py)
 *
 * Resizing keeps the edges opposite to grab.edges fixed and never
 * goes below GRAB_MIN_SIZE in either dimension.
 */
struct wlr_box grab_motion(const grab &grab, double px, double py);

/*
 * Whether applying @geo takes the window out of the tiling. A move
 * always does; a resize only once the size differs from grab.start, so
 * a resize released without changing anything leaves a tiled window
 * tiled.
 */
bool grab_detaches(const grab &grab, struct wlr_box geo);

void grab_end(grab &grab);

/* Edges nearest to the pointer, by quadrant of @geo */
enum swc_edge grab_edges_at(struct wlr_box geo, double px, double py);

/*
 * Pointer buttons currently held, with the serial of each press.
 * Client move/resize requests carry one of these serials.
 */
struct pressed_buttons {
	struct entry {
		uint32_t button;
		uint32_t serial;
	};
	std::vector<entry> entries;

	void press(uint32_t button, uint32_t serial);
	void release(uint32_t button);
	void clear() { entries.clear(); }
	bool empty() const { return entries.empty(); }
	bool validate(uint32_t serial) const;
};

#endif /* STACKWC_GRAB_H */
