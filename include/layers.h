/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_LAYERS_H
#define STACKWC_LAYERS_H

#include <vector>
#include <wayland-server-core.h>
#include <wlr/util/box.h>
#include "common/listener.h"
#include "render.h"

struct output;
struct wlr_layer_surface_v1;

struct swc_layer_surface : public destroyable {
	struct wlr_layer_surface_v1 *layer_surface;
	struct output *output;
	/* output-relative, set by layers_arrange() */
	struct wlr_box geo = {};
	bool mapped = false;
	/* true only inside handle_unmap() */
	bool being_unmapped = false;

	~swc_layer_surface();

	DECLARE_HANDLER(swc_layer_surface, map);
	DECLARE_HANDLER(swc_layer_surface, unmap);
	DECLARE_HANDLER(swc_layer_surface, commit);
	DECLARE_HANDLER(swc_layer_surface, new_popup);
};

void layers_init(void);
void layers_finish(void);

/**
 * layers_arrange() - position the layer surfaces of @output
 *
 * Returns the usable area left over by exclusive zones, in
 * output-relative coordinates.
 */
struct wlr_box layers_arrange(struct output *output);

/* Called when the output goes away */
void layers_destroy_output(struct output *output);

void layer_try_set_focus(struct wlr_layer_surface_v1 *layer_surface);

/*
 * Mapped surfaces (subsurfaces included) of the background and bottom
 * layers when @upper is false, of the top and overlay layers and of
 * every layer popup otherwise. Layout coordinates.
 */
void layers_collect(struct output *output, bool upper,
	std::vector<layer_item> &items);

/* Surface of an upper (or lower) layer at a layout position */
struct wlr_surface *layers_surface_at(struct output *output, bool upper,
	double lx, double ly, double *sx, double *sy);

#endif /* STACKWC_LAYERS_H */
