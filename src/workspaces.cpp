// SPDX-License-Identifier: GPL-2.0-only
#include "workspaces.h"
#include <assert.h>
#include <stdlib.h>
#include <wlr/util/log.h>
#include "common/alg.h"
#include "config/rcxml.h"

const char *
window_mode_name(enum window_mode mode)
{
	switch (mode) {
	case WINDOW_MODE_TILED:
		return "tiled";
	case WINDOW_MODE_FLOATING:
		return "floating";
	case WINDOW_MODE_FULLSCREEN:
		return "fullscreen";
	}
	return "unknown";
}

static bool
box_equal(const struct wlr_box &a, const struct wlr_box &b)
{
	return a.x == b.x && a.y == b.y && a.width == b.width
		&& a.height == b.height;
}

static void
center(const struct wlr_box &box, int *x, int *y)
{
	*x = box.x + box.width / 2;
	*y = box.y + box.height / 2;
}

/* Length of the overlap of [a1, a1 + alen) and [b1, b1 + blen) */
static int
overlap(int a1, int alen, int b1, int blen)
{
	int start = std::max(a1, b1);
	int end = std::min(a1 + alen, b1 + blen);
	return std::max(0, end - start);
}

window *
workspace::find(const toplevel *client)
{
	auto it = swc::find_if(windows,
		[&](auto &win) { return win.client == client; });
	return it != windows.end() ? &*it : nullptr;
}

window *
workspace::fullscreen_window()
{
	auto it = swc::find_if(windows,
		[](auto &win) { return win.mode == WINDOW_MODE_FULLSCREEN; });
	return it != windows.end() ? &*it : nullptr;
}

const mapped_output *
workspace::primary_output() const
{
	return outputs.empty() ? nullptr : &outputs[0];
}

std::vector<window *>
workspace::stacking_order()
{
	std::vector<window *> order;
	window *fullscreen = fullscreen_window();
	if (fullscreen) {
		order.push_back(fullscreen);
		return order;
	}

	window *raised = nullptr;
	for (auto &win : windows) {
		if (win.mode == WINDOW_MODE_TILED) {
			order.push_back(&win);
		}
	}
	for (auto &win : windows) {
		if (win.mode != WINDOW_MODE_FLOATING) {
			continue;
		}
		if (active == win.client) {
			raised = &win;
		} else {
			order.push_back(&win);
		}
	}
	if (raised) {
		order.push_back(raised);
	}
	return order;
}

window *
workspace_best_candidate(workspace &ws, const window &from,
		enum swc_edge direction)
{
	int fx, fy;
	center(from.geometry, &fx, &fy);

	window *best = nullptr;
	int best_distance = 0;

	for (auto &cand : ws.windows) {
		if (cand.client == from.client
				|| cand.mode == WINDOW_MODE_FULLSCREEN) {
			continue;
		}
		int cx, cy;
		center(cand.geometry, &cx, &cy);
		int dx = cx - fx;
		int dy = cy - fy;

		bool valid = false;
		switch (direction) {
		case SWC_EDGE_LEFT:
		case SWC_EDGE_RIGHT:
			valid = (direction == SWC_EDGE_LEFT ? dx < 0 : dx > 0)
				&& overlap(from.geometry.y, from.geometry.height,
					cand.geometry.y, cand.geometry.height) > 0;
			break;
		case SWC_EDGE_TOP:
		case SWC_EDGE_BOTTOM:
			valid = (direction == SWC_EDGE_TOP ? dy < 0 : dy > 0)
				&& overlap(from.geometry.x, from.geometry.width,
					cand.geometry.x, cand.geometry.width) > 0;
			break;
		default:
			break;
		}
		if (!valid) {
			continue;
		}

		int distance = abs(dx) + abs(dy);
		if (!best || distance < best_distance) {
			best = &cand;
			best_distance = distance;
		}
	}
	return best;
}

void
workspace_manager::init(int count)
{
	assert(count >= WORKSPACES_MIN);
	workspaces.clear();
	workspaces.resize(count);
	for (int i = 0; i < count; i++) {
		workspaces[i].index = i;
		workspaces[i].fullscreen_restore = {};
	}
	active_index = 0;
}

void
workspace_manager::finish()
{
	workspaces.clear();
	active_index = 0;
}

workspace &
workspace_manager::current()
{
	assert(active_index < workspaces.size());
	return workspaces[active_index];
}

window *
workspace_manager::find_window(const toplevel *client, workspace **ws)
{
	for (auto &w : workspaces) {
		window *win = w.find(client);
		if (win) {
			if (ws) {
				*ws = &w;
			}
			return win;
		}
	}
	return nullptr;
}

void
workspace_manager::notify_damage()
{
	if (hooks.damage) {
		hooks.damage();
	}
}

void
workspace_manager::relayout(workspace &ws)
{
	const mapped_output *output = ws.primary_output();
	if (!output) {
		/* windows keep their geometry until an output appears */
		return;
	}

	std::vector<toplevel *> tiled;
	for (auto &win : ws.windows) {
		if (win.mode == WINDOW_MODE_TILED) {
			tiled.push_back(win.client);
		}
	}

	int offset = rc.gap + rc.border_thickness;
	auto placements = layout_place(ws.layout, tiled, output->usable);
	for (auto &p : placements) {
		window *win = ws.find(p.client);
		assert(win);
		struct wlr_box geo = {
			.x = p.box.x + offset,
			.y = p.box.y + offset,
			.width = std::max(1, p.box.width - 2 * offset),
			.height = std::max(1, p.box.height - 2 * offset),
		};
		if (!box_equal(geo, win->geometry)) {
			win->geometry = geo;
			win->client->configure(geo);
		}
	}

	window *fullscreen = ws.fullscreen_window();
	if (fullscreen && !box_equal(fullscreen->geometry, output->box)) {
		fullscreen->geometry = output->box;
		fullscreen->client->configure(output->box);
	}

	wlr_log(WLR_DEBUG, "workspace %d: %s layout of %zu windows",
		ws.index + 1, layout_name(ws.layout), tiled.size());
}

void
workspace_manager::set_active(toplevel *client)
{
	workspace &ws = current();
	if (client && !ws.find(client)) {
		wlr_log(WLR_DEBUG, "cannot activate window off workspace %d",
			ws.index + 1);
		return;
	}
	if (ws.active == client) {
		return;
	}

	toplevel *old = ws.active.get();
	if (old) {
		old->set_activated(false);
	}
	ws.previous = old;
	ws.active = client;
	if (client) {
		client->set_activated(true);
	}
	if (hooks.focus) {
		hooks.focus(client);
	}
	notify_damage();
}

void
workspace_manager::insert_window(toplevel *client)
{
	if (find_window(client)) {
		return;
	}
	workspace &ws = current();
	ws.windows.push_back({
		.client = client,
		.mode = WINDOW_MODE_TILED,
		.geometry = {},
		.restore_mode = WINDOW_MODE_TILED,
	});
	relayout(ws);
	if (ws.fullscreen_window()) {
		/* tiled behind the fullscreen window, which keeps focus */
		wlr_log(WLR_DEBUG, "workspace %d: window mapped behind "
			"fullscreen", ws.index + 1);
	} else {
		set_active(client);
	}
	notify_damage();
}

void
workspace_manager::remove_window(toplevel *client)
{
	workspace *ws = nullptr;
	window *win = find_window(client, &ws);
	if (!win) {
		return;
	}
	if (win->mode == WINDOW_MODE_FULLSCREEN) {
		ws->fullscreen_restore = {};
	}
	swc::remove_if(ws->windows,
		[&](auto &w) { return w.client == client; });

	bool was_active = (ws->active == client);
	if (was_active) {
		ws->active.reset();
	}
	if (ws->previous == client) {
		ws->previous.reset();
	}
	relayout(*ws);

	if (ws == &current()) {
		if (was_active && hooks.focus) {
			hooks.focus(nullptr);
		}
		notify_damage();
	}
}

bool
workspace_manager::set_active_workspace(size_t index)
{
	if (index >= workspaces.size()) {
		wlr_log(WLR_DEBUG, "no workspace %zu", index + 1);
		return false;
	}
	if (index == active_index) {
		return false;
	}

	for (auto &win : current().windows) {
		win.client->set_visible(false);
	}
	active_index = index;
	workspace &ws = current();
	for (auto &win : ws.windows) {
		win.client->set_visible(true);
	}

	wlr_log(WLR_INFO, "switched to workspace %zu", index + 1);

	if (hooks.focus) {
		hooks.focus(ws.active.get());
	}
	notify_damage();
	return true;
}

void
workspace_manager::leave_fullscreen(workspace &ws, window &win)
{
	assert(win.mode == WINDOW_MODE_FULLSCREEN);
	win.mode = win.restore_mode;
	win.geometry = ws.fullscreen_restore;
	ws.fullscreen_restore = {};
	win.client->set_fullscreen(false);
	win.client->configure(win.geometry);
}

bool
workspace_manager::move_window_to_workspace(size_t index)
{
	if (index >= workspaces.size() || index == active_index) {
		return false;
	}
	workspace &from = current();
	toplevel *client = from.active.get();
	if (!client) {
		return false;
	}

	window *found = from.find(client);
	assert(found);
	if (found->mode == WINDOW_MODE_FULLSCREEN) {
		leave_fullscreen(from, *found);
	}
	window moved = *found;
	swc::remove_if(from.windows,
		[&](auto &w) { return w.client == client; });
	from.active.reset();
	relayout(from);

	set_active_workspace(index);

	workspace &to = current();
	to.windows.push_back(moved);
	relayout(to);
	set_active(client);
	notify_damage();
	return true;
}

bool
workspace_manager::change_focus(enum swc_edge direction,
		struct wlr_point *pointer)
{
	workspace &ws = current();
	window *from = ws.find(ws.active.get());
	if (!from || from->mode == WINDOW_MODE_FULLSCREEN) {
		return false;
	}
	window *cand = workspace_best_candidate(ws, *from, direction);
	if (!cand) {
		return false;
	}
	center(cand->geometry, &pointer->x, &pointer->y);
	return true;
}

bool
workspace_manager::move_window(enum swc_edge direction,
		struct wlr_point *pointer)
{
	workspace &ws = current();
	window *from = ws.find(ws.active.get());
	if (!from || from->mode == WINDOW_MODE_FULLSCREEN) {
		return false;
	}
	window *cand = workspace_best_candidate(ws, *from, direction);
	if (!cand) {
		return false;
	}

	toplevel *client = from->client;
	struct wlr_box from_geo = from->geometry;
	struct wlr_box cand_geo = cand->geometry;

	/* Rows trade places; floating windows also trade rectangles */
	std::swap(*from, *cand);
	if (from->mode == WINDOW_MODE_FLOATING) {
		from->geometry = from_geo;
		from->client->configure(from_geo);
	}
	if (cand->mode == WINDOW_MODE_FLOATING) {
		cand->geometry = cand_geo;
		cand->client->configure(cand_geo);
	}
	relayout(ws);

	window *moved = ws.find(client);
	assert(moved);
	center(moved->geometry, &pointer->x, &pointer->y);
	notify_damage();
	return true;
}

bool
workspace_manager::set_fullscreen(toplevel *client, bool fullscreen)
{
	workspace *ws = nullptr;
	window *win = find_window(client, &ws);
	if (!win) {
		return false;
	}

	if (!fullscreen) {
		if (win->mode != WINDOW_MODE_FULLSCREEN) {
			return false;
		}
		leave_fullscreen(*ws, *win);
		relayout(*ws);
		notify_damage();
		return true;
	}

	if (win->mode == WINDOW_MODE_FULLSCREEN) {
		return false;
	}
	const mapped_output *output = ws->primary_output();
	if (!output) {
		wlr_log(WLR_DEBUG, "no output to fullscreen %s on",
			client->get_app_id());
		return false;
	}

	/* At most one fullscreen window per workspace */
	window *other = ws->fullscreen_window();
	if (other) {
		leave_fullscreen(*ws, *other);
	}

	ws->fullscreen_restore = win->geometry;
	win->restore_mode = win->mode;
	win->mode = WINDOW_MODE_FULLSCREEN;
	win->geometry = output->box;
	client->set_fullscreen(true);
	client->configure(win->geometry);
	relayout(*ws);
	if (ws == &current() && !(ws->active == client)) {
		/* the only window shown must hold focus */
		set_active(client);
	}
	notify_damage();
	return true;
}

bool
workspace_manager::toggle_floating(toplevel *client)
{
	workspace *ws = nullptr;
	window *win = find_window(client, &ws);
	if (!win || win->mode == WINDOW_MODE_FULLSCREEN) {
		return false;
	}
	win->mode = (win->mode == WINDOW_MODE_TILED)
		? WINDOW_MODE_FLOATING : WINDOW_MODE_TILED;
	relayout(*ws);
	notify_damage();
	return true;
}

bool
workspace_manager::place_floating(toplevel *client, struct wlr_box geo)
{
	workspace *ws = nullptr;
	window *win = find_window(client, &ws);
	if (!win || win->mode == WINDOW_MODE_FULLSCREEN) {
		return false;
	}
	bool was_tiled = (win->mode == WINDOW_MODE_TILED);
	win->mode = WINDOW_MODE_FLOATING;
	if (!box_equal(win->geometry, geo)) {
		bool resized = win->geometry.width != geo.width
			|| win->geometry.height != geo.height;
		win->geometry = geo;
		if (resized) {
			client->configure(geo);
		}
	}
	if (was_tiled) {
		relayout(*ws);
	}
	notify_damage();
	return true;
}

toplevel *
workspace_manager::window_at(double lx, double ly)
{
	auto order = current().stacking_order();
	for (auto it = order.rbegin(); it != order.rend(); ++it) {
		if (wlr_box_contains_point(&(*it)->geometry, lx, ly)) {
			return (*it)->client;
		}
	}
	return nullptr;
}

void
workspace_manager::map_output(uint32_t id, const char *name,
		struct wlr_box box)
{
	for (auto &ws : workspaces) {
		auto it = swc::find_if(ws.outputs,
			[&](auto &o) { return o.id == id; });
		if (it != ws.outputs.end()) {
			it->box = box;
			it->usable = box;
		} else {
			ws.outputs.push_back({
				.id = id,
				.name = swc_str(name),
				.box = box,
				.usable = box,
			});
		}
		relayout(ws);
	}
	notify_damage();
}

void
workspace_manager::unmap_output(uint32_t id)
{
	for (auto &ws : workspaces) {
		swc::remove_if(ws.outputs, [&](auto &o) { return o.id == id; });
		relayout(ws);
	}
	notify_damage();
}

void
workspace_manager::update_output_area(uint32_t id, struct wlr_box usable)
{
	for (auto &ws : workspaces) {
		auto it = swc::find_if(ws.outputs,
			[&](auto &o) { return o.id == id; });
		if (it == ws.outputs.end() || box_equal(it->usable, usable)) {
			continue;
		}
		it->usable = usable;
		relayout(ws);
	}
	notify_damage();
}
