// SPDX-License-Identifier: GPL-2.0-only
#include "grab.h"
#include <algorithm>
#include <wlr/util/log.h>
#include "common/alg.h"

void
grab_begin_move(grab &grab, toplevel *client, struct wlr_box geo,
		double px, double py)
{
	grab.mode = GRAB_MOVE;
	grab.client = client;
	grab.pointer_x = px;
	grab.pointer_y = py;
	grab.start = {
		.x = (int)px - geo.width / 2,
		.y = (int)py - geo.height / 2,
		.width = geo.width,
		.height = geo.height,
	};
	grab.edges = SWC_EDGE_NONE;
}

void
grab_begin_resize(grab &grab, toplevel *client, struct wlr_box geo,
		enum swc_edge edges, double px, double py)
{
	grab.mode = GRAB_RESIZE;
	grab.client = client;
	grab.pointer_x = px;
	grab.pointer_y = py;
	grab.start = geo;
	grab.edges = edges;
}

struct wlr_box
grab_motion(const grab &grab, double px, double py)
{
	int dx = (int)(px - grab.pointer_x);
	int dy = (int)(py - grab.pointer_y);
	struct wlr_box box = grab.start;

	switch (grab.mode) {
	case GRAB_MOVE:
		box.x += dx;
		box.y += dy;
		break;
	case GRAB_RESIZE:
		if (grab.edges & SWC_EDGE_LEFT) {
			box.width = std::max(GRAB_MIN_SIZE, grab.start.width - dx);
			box.x = grab.start.x + grab.start.width - box.width;
		} else if (grab.edges & SWC_EDGE_RIGHT) {
			box.width = std::max(GRAB_MIN_SIZE, grab.start.width + dx);
		}
		if (grab.edges & SWC_EDGE_TOP) {
			box.height = std::max(GRAB_MIN_SIZE, grab.start.height - dy);
			box.y = grab.start.y + grab.start.height - box.height;
		} else if (grab.edges & SWC_EDGE_BOTTOM) {
			box.height = std::max(GRAB_MIN_SIZE, grab.start.height + dy);
		}
		break;
	case GRAB_NONE:
		break;
	}
	return box;
}

bool
grab_detaches(const grab &grab, struct wlr_box geo)
{
	switch (grab.mode) {
	case GRAB_MOVE:
		return true;
	case GRAB_RESIZE:
		return geo.width != grab.start.width
			|| geo.height != grab.start.height;
	case GRAB_NONE:
		break;
	}
	return false;
}

void
grab_end(grab &grab)
{
	grab.mode = GRAB_NONE;
	grab.client.reset();
	grab.edges = SWC_EDGE_NONE;
}

enum swc_edge
grab_edges_at(struct wlr_box geo, double px, double py)
{
	enum swc_edge edges = SWC_EDGE_NONE;
	edges |= (px < geo.x + geo.width / 2.0) ? SWC_EDGE_LEFT : SWC_EDGE_RIGHT;
	edges |= (py < geo.y + geo.height / 2.0) ? SWC_EDGE_TOP : SWC_EDGE_BOTTOM;
	return edges;
}

void
pressed_buttons::press(uint32_t button, uint32_t serial)
{
	for (auto &e : entries) {
		if (e.button == button) {
			e.serial = serial;
			return;
		}
	}
	entries.push_back({button, serial});
}

void
pressed_buttons::release(uint32_t button)
{
	swc::remove_if(entries, [&](auto &e) { return e.button == button; });
}

bool
pressed_buttons::validate(uint32_t serial) const
{
	/* 0 is recorded for presses no client received */
	for (auto &e : entries) {
		if (serial && e.serial == serial) {
			return true;
		}
	}
	wlr_log(WLR_DEBUG, "serial %u does not match a pressed button",
		serial);
	return false;
}
