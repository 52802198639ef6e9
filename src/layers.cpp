// SPDX-License-Identifier: GPL-2.0-only
/*
 * layers.cpp - layer-shell arrangement and focus
 *
 * Based on https://github.com/swaywm/sway
 * Copyright (C) 2019 Drew DeVault and Sway developers
 */

#include "layers.h"
#include <assert.h>
#include <stdlib.h>
#include <wlr/types/wlr_cursor.h>
#include <wlr/types/wlr_layer_shell_v1.h>
#include <wlr/types/wlr_output_layout.h>
#include <wlr/types/wlr_xdg_shell.h>
#include <wlr/util/log.h>
#include "common/alg.h"
#include "input/cursor.h"
#include "output.h"
#include "stackwc.h"
#include "xdg.h"

#define SWC_LAYERSHELL_VERSION 4

static void
apply_exclusive_zone(struct wlr_layer_surface_v1 *layer_surface,
		struct wlr_box *usable_area)
{
	struct wlr_layer_surface_v1_state *state = &layer_surface->current;
	switch (wlr_layer_surface_v1_get_exclusive_edge(layer_surface)) {
	case ZWLR_LAYER_SURFACE_V1_ANCHOR_TOP:
		usable_area->y += state->exclusive_zone + state->margin.top;
		usable_area->height -= state->exclusive_zone + state->margin.top;
		break;
	case ZWLR_LAYER_SURFACE_V1_ANCHOR_BOTTOM:
		usable_area->height -=
			state->exclusive_zone + state->margin.bottom;
		break;
	case ZWLR_LAYER_SURFACE_V1_ANCHOR_LEFT:
		usable_area->x += state->exclusive_zone + state->margin.left;
		usable_area->width -= state->exclusive_zone + state->margin.left;
		break;
	case ZWLR_LAYER_SURFACE_V1_ANCHOR_RIGHT:
		usable_area->width -= state->exclusive_zone + state->margin.right;
		break;
	default:
		break;
	}
	if (usable_area->width < 0) {
		usable_area->width = 0;
	}
	if (usable_area->height < 0) {
		usable_area->height = 0;
	}
}

static void
configure_surface(struct swc_layer_surface *surface,
		const struct wlr_box *full_area, struct wlr_box *usable_area)
{
	struct wlr_layer_surface_v1 *layer_surface = surface->layer_surface;
	struct wlr_layer_surface_v1_state *state = &layer_surface->current;

	/* an exclusive zone of -1 means "ignore other exclusive zones" */
	struct wlr_box bounds = state->exclusive_zone == -1
		? *full_area : *usable_area;

	struct wlr_box box = {
		.width = (int)state->desired_width,
		.height = (int)state->desired_height,
	};

	const uint32_t both_horiz = ZWLR_LAYER_SURFACE_V1_ANCHOR_LEFT
		| ZWLR_LAYER_SURFACE_V1_ANCHOR_RIGHT;
	if (box.width == 0) {
		box.x = bounds.x + state->margin.left;
		box.width = bounds.width
			- (state->margin.left + state->margin.right);
	} else if ((state->anchor & both_horiz) == both_horiz) {
		box.x = bounds.x + bounds.width / 2 - box.width / 2;
	} else if (state->anchor & ZWLR_LAYER_SURFACE_V1_ANCHOR_LEFT) {
		box.x = bounds.x + state->margin.left;
	} else if (state->anchor & ZWLR_LAYER_SURFACE_V1_ANCHOR_RIGHT) {
		box.x = bounds.x + bounds.width - box.width - state->margin.right;
	} else {
		box.x = bounds.x + bounds.width / 2 - box.width / 2;
	}

	const uint32_t both_vert = ZWLR_LAYER_SURFACE_V1_ANCHOR_TOP
		| ZWLR_LAYER_SURFACE_V1_ANCHOR_BOTTOM;
	if (box.height == 0) {
		box.y = bounds.y + state->margin.top;
		box.height = bounds.height
			- (state->margin.top + state->margin.bottom);
	} else if ((state->anchor & both_vert) == both_vert) {
		box.y = bounds.y + bounds.height / 2 - box.height / 2;
	} else if (state->anchor & ZWLR_LAYER_SURFACE_V1_ANCHOR_TOP) {
		box.y = bounds.y + state->margin.top;
	} else if (state->anchor & ZWLR_LAYER_SURFACE_V1_ANCHOR_BOTTOM) {
		box.y = bounds.y + bounds.height - box.height
			- state->margin.bottom;
	} else {
		box.y = bounds.y + bounds.height / 2 - box.height / 2;
	}

	if (box.width <= 0 || box.height <= 0) {
		wlr_log(WLR_ERROR, "no room for layer surface %p", layer_surface);
		return;
	}

	surface->geo = box;
	wlr_layer_surface_v1_configure(layer_surface, box.width, box.height);

	if (layer_surface->surface->mapped && state->exclusive_zone > 0) {
		apply_exclusive_zone(layer_surface, usable_area);
	}
}

static void
arrange_one_layer(const struct wlr_box *full_area, struct wlr_box *usable_area,
		std::vector<swc_layer_surface *> &layer, bool exclusive)
{
	for (auto surface : layer) {
		struct wlr_layer_surface_v1 *layer_surface =
			surface->layer_surface;
		if (!layer_surface->initialized) {
			continue;
		}
		if (surface->being_unmapped) {
			continue;
		}
		if (!!layer_surface->current.exclusive_zone != exclusive) {
			continue;
		}
		configure_surface(surface, full_area, usable_area);
	}
}

/*
 * Called from output_update_usable_area() only, which propagates the
 * result to the workspaces.
 */
struct wlr_box
layers_arrange(struct output *output)
{
	assert(output);
	struct wlr_box full_area = {};
	wlr_output_effective_resolution(output->wlr_output,
		&full_area.width, &full_area.height);
	struct wlr_box usable_area = full_area;

	/*
	 * Exclusive-zone clients first, from the overlay layer down, so
	 * that higher layers get placement preference and the others
	 * give way to them regardless of launch order.
	 */
	for (int i = SWC_NR_LAYERS - 1; i >= 0; i--) {
		arrange_one_layer(&full_area, &usable_area, output->layers[i],
			/* exclusive */ true);
	}
	for (int i = 0; i < SWC_NR_LAYERS; i++) {
		arrange_one_layer(&full_area, &usable_area, output->layers[i],
			/* exclusive */ false);
	}
	return usable_area;
}

void
layers_destroy_output(struct output *output)
{
	for (auto &layer : output->layers) {
		auto surfaces = layer;
		for (auto surface : surfaces) {
			surface->layer_surface->output = nullptr;
			surface->output = nullptr;
			wlr_layer_surface_v1_destroy(surface->layer_surface);
		}
		layer.clear();
	}
}

static inline bool
has_exclusive_interactivity(struct wlr_layer_surface_v1 *layer_surface)
{
	return layer_surface->current.keyboard_interactive
		== ZWLR_LAYER_SURFACE_V1_KEYBOARD_INTERACTIVITY_EXCLUSIVE;
}

/*
 * Pass focus to another exclusive layer-shell client on the output
 * nearest to the cursor, or else back to the windows.
 */
static void
try_to_focus_next_layer_or_toplevel(void)
{
	struct output *output = output_nearest_to_cursor();
	if (output) {
		for (int i = ZWLR_LAYER_SHELL_V1_LAYER_OVERLAY;
				i >= ZWLR_LAYER_SHELL_V1_LAYER_TOP; i--) {
			auto &layer = output->layers[i];
			/* latest first */
			for (auto it = layer.rbegin(); it != layer.rend(); ++it) {
				struct wlr_layer_surface_v1 *layer_surface =
					(*it)->layer_surface;
				/* we may come from the unmap handler */
				if (!layer_surface->surface->mapped) {
					continue;
				}
				if (has_exclusive_interactivity(layer_surface)) {
					wlr_log(WLR_DEBUG,
						"focus next exclusive layer client");
					seat_set_focus_layer(layer_surface);
					return;
				}
			}
		}
	}

	if (g_seat.focused_layer) {
		seat_set_focus_layer(nullptr);
	}
}

static bool
focused_layer_has_exclusive_interactivity(void)
{
	if (!g_seat.focused_layer) {
		return false;
	}
	return has_exclusive_interactivity(g_seat.focused_layer);
}

/*
 * Precedence is defined as being in the same or higher (overlay is highest)
 * than the layer with current keyboard focus.
 */
static bool
has_precedence(enum zwlr_layer_shell_v1_layer layer)
{
	if (!focused_layer_has_exclusive_interactivity()) {
		return true;
	}
	return layer >= g_seat.focused_layer->current.layer;
}

void
layer_try_set_focus(struct wlr_layer_surface_v1 *layer_surface)
{
	switch (layer_surface->current.keyboard_interactive) {
	case ZWLR_LAYER_SURFACE_V1_KEYBOARD_INTERACTIVITY_EXCLUSIVE:
		wlr_log(WLR_DEBUG, "interactive-exclusive '%p'", layer_surface);
		if (has_precedence(layer_surface->current.layer)) {
			seat_set_focus_layer(layer_surface);
		}
		break;
	case ZWLR_LAYER_SURFACE_V1_KEYBOARD_INTERACTIVITY_ON_DEMAND:
		wlr_log(WLR_DEBUG, "interactive-on-demand '%p'", layer_surface);
		if (!focused_layer_has_exclusive_interactivity()) {
			seat_set_focus_layer(layer_surface);
		}
		break;
	case ZWLR_LAYER_SURFACE_V1_KEYBOARD_INTERACTIVITY_NONE:
		wlr_log(WLR_DEBUG, "interactive-none '%p'", layer_surface);
		if (g_seat.focused_layer == layer_surface) {
			try_to_focus_next_layer_or_toplevel();
		}
		break;
	}
}

static void
move_to_layer(struct swc_layer_surface *surface,
		enum zwlr_layer_shell_v1_layer layer)
{
	for (auto &list : surface->output->layers) {
		swc::remove(list, surface);
	}
	surface->output->layers[layer].push_back(surface);
}

void
swc_layer_surface::handle_commit(void *)
{
	if (!output) {
		return;
	}

	uint32_t committed = layer_surface->current.committed;

	if (committed & WLR_LAYER_SURFACE_V1_STATE_LAYER) {
		move_to_layer(this, layer_surface->current.layer);
	}
	if (committed & WLR_LAYER_SURFACE_V1_STATE_KEYBOARD_INTERACTIVITY) {
		/*
		 * On-demand interactivity is only honoured through normal
		 * focus semantics, i.e. a button press on the surface.
		 */
		if (layer_surface->current.keyboard_interactive
				== ZWLR_LAYER_SURFACE_V1_KEYBOARD_INTERACTIVITY_ON_DEMAND) {
			/* must be a change from EXCLUSIVE */
			if (g_seat.focused_layer == layer_surface) {
				try_to_focus_next_layer_or_toplevel();
			}
		} else {
			layer_try_set_focus(layer_surface);
		}
	}

	if (committed || mapped != layer_surface->surface->mapped) {
		mapped = layer_surface->surface->mapped;
		output_update_usable_area(output);
		/* enter a new, moved or resized layer surface */
		cursor_update_focus();
	}
}

swc_layer_surface::~swc_layer_surface()
{
	if (layer_surface == g_seat.focused_layer) {
		seat_set_focus_layer(nullptr);
	}
	if (output) {
		for (auto &list : output->layers) {
			swc::remove(list, this);
		}
		if (mapped) {
			output_update_usable_area(output);
		}
	}
}

void
swc_layer_surface::handle_unmap(void *)
{
	/*
	 * A configure sent from the unmap handler would be acked with a
	 * serial wlroots no longer expects, which kills the client.
	 * being_unmapped makes arrange_one_layer() skip this surface.
	 */
	being_unmapped = true;
	mapped = false;

	if (output) {
		output_update_usable_area(output);
	}
	if (g_seat.focused_layer == layer_surface) {
		try_to_focus_next_layer_or_toplevel();
	}
	cursor_update_focus();

	being_unmapped = false;
}

void
swc_layer_surface::handle_map(void *)
{
	mapped = true;
	if (output) {
		output_update_usable_area(output);
		output_enter_all(layer_surface->surface);
	}
	layer_try_set_focus(layer_surface);
}

/* This popup's parent is a layer surface */
void
swc_layer_surface::handle_new_popup(void *data)
{
	auto wlr_popup = (struct wlr_xdg_popup *)data;
	if (!output) {
		wlr_xdg_popup_destroy(wlr_popup);
		return;
	}

	/* the output, relative to the layer surface */
	struct wlr_box output_box = output_layout_box(output);
	struct wlr_box constraint = {
		.x = -geo.x,
		.y = -geo.y,
		.width = output_box.width,
		.height = output_box.height,
	};
	xdg_popup_create(wlr_popup, constraint);
}

static void
handle_new_layer_surface(struct wl_listener *listener, void *data)
{
	auto layer_surface = (struct wlr_layer_surface_v1 *)data;

	if (!layer_surface->output) {
		struct output *output = output_nearest_to_cursor();
		if (!output) {
			wlr_log(WLR_INFO,
				"No output available to assign layer surface");
			wlr_layer_surface_v1_destroy(layer_surface);
			return;
		}
		layer_surface->output = output->wlr_output;
	}

	auto output = (struct output *)layer_surface->output->data;
	if (!output || output->global_disabled) {
		wlr_log(WLR_INFO, "layer surface requested an unusable output");
		wlr_layer_surface_v1_destroy(layer_surface);
		return;
	}

	auto surface = new swc_layer_surface();
	surface->layer_surface = layer_surface;
	surface->output = output;
	layer_surface->data = surface;
	output->layers[layer_surface->pending.layer].push_back(surface);

	CONNECT_LISTENER(layer_surface, surface, destroy);
	CONNECT_LISTENER(layer_surface->surface, surface, commit);
	CONNECT_LISTENER(layer_surface->surface, surface, map);
	CONNECT_LISTENER(layer_surface->surface, surface, unmap);
	CONNECT_LISTENER(layer_surface, surface, new_popup);
}

struct collect_ctx {
	std::vector<layer_item> *items;
	/* layer surface origin, layout coordinates */
	int x;
	int y;
};

static void
add_item(struct wlr_surface *surface, int sx, int sy, void *data)
{
	auto ctx = (struct collect_ctx *)data;
	layer_item item;
	item.surface = surface;
	item.box = {
		.x = ctx->x + sx,
		.y = ctx->y + sy,
		.width = surface->current.width,
		.height = surface->current.height,
	};
	ctx->items->push_back(item);
}

void
layers_collect(struct output *output, bool upper,
		std::vector<layer_item> &items)
{
	struct wlr_box output_box = output_layout_box(output);
	int first = upper ? ZWLR_LAYER_SHELL_V1_LAYER_TOP
		: ZWLR_LAYER_SHELL_V1_LAYER_BACKGROUND;
	int last = upper ? ZWLR_LAYER_SHELL_V1_LAYER_OVERLAY
		: ZWLR_LAYER_SHELL_V1_LAYER_BOTTOM;

	for (int i = first; i <= last; i++) {
		for (auto surface : output->layers[i]) {
			if (!surface->mapped) {
				continue;
			}
			struct collect_ctx ctx = {
				.items = &items,
				.x = output_box.x + surface->geo.x,
				.y = output_box.y + surface->geo.y,
			};
			wlr_layer_surface_v1_for_each_surface(
				surface->layer_surface, add_item, &ctx);
		}
	}

	if (!upper) {
		return;
	}
	/* popups of every layer go on top, so menus of panels stay visible */
	for (auto &layer : output->layers) {
		for (auto surface : layer) {
			if (!surface->mapped) {
				continue;
			}
			struct collect_ctx ctx = {
				.items = &items,
				.x = output_box.x + surface->geo.x,
				.y = output_box.y + surface->geo.y,
			};
			wlr_layer_surface_v1_for_each_popup_surface(
				surface->layer_surface, add_item, &ctx);
		}
	}
}

static struct wlr_surface *
popup_surface_at(struct output *output, struct wlr_box output_box,
		double lx, double ly, double *sx, double *sy)
{
	for (int i = SWC_NR_LAYERS - 1; i >= 0; i--) {
		auto &layer = output->layers[i];
		for (auto it = layer.rbegin(); it != layer.rend(); ++it) {
			auto surface = *it;
			if (!surface->mapped) {
				continue;
			}
			struct wlr_surface *found =
				wlr_layer_surface_v1_popup_surface_at(
					surface->layer_surface,
					lx - output_box.x - surface->geo.x,
					ly - output_box.y - surface->geo.y,
					sx, sy);
			if (found) {
				return found;
			}
		}
	}
	return nullptr;
}

struct wlr_surface *
layers_surface_at(struct output *output, bool upper, double lx, double ly,
		double *sx, double *sy)
{
	struct wlr_box output_box = output_layout_box(output);
	if (upper) {
		struct wlr_surface *popup =
			popup_surface_at(output, output_box, lx, ly, sx, sy);
		if (popup) {
			return popup;
		}
	}

	int first = upper ? ZWLR_LAYER_SHELL_V1_LAYER_OVERLAY
		: ZWLR_LAYER_SHELL_V1_LAYER_BOTTOM;
	int last = upper ? ZWLR_LAYER_SHELL_V1_LAYER_TOP
		: ZWLR_LAYER_SHELL_V1_LAYER_BACKGROUND;
	for (int i = first; i >= last; i--) {
		auto &layer = output->layers[i];
		for (auto it = layer.rbegin(); it != layer.rend(); ++it) {
			auto surface = *it;
			if (!surface->mapped) {
				continue;
			}
			struct wlr_surface *found = wlr_layer_surface_v1_surface_at(
				surface->layer_surface,
				lx - output_box.x - surface->geo.x,
				ly - output_box.y - surface->geo.y, sx, sy);
			if (found) {
				return found;
			}
		}
	}
	return nullptr;
}

void
layers_init(void)
{
	g_server.layer_shell = wlr_layer_shell_v1_create(g_server.wl_display,
		SWC_LAYERSHELL_VERSION);
	if (!g_server.layer_shell) {
		wlr_log(WLR_ERROR, "unable to create the layer shell interface");
		exit(EXIT_FAILURE);
	}
	g_server.new_layer_surface.notify = handle_new_layer_surface;
	wl_signal_add(&g_server.layer_shell->events.new_surface,
		&g_server.new_layer_surface);
}

void
layers_finish(void)
{
	wl_list_remove(&g_server.new_layer_surface.link);
}
