/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_RENDER_H
#define STACKWC_RENDER_H

#include <pixman.h>
#include <variant>
#include <vector>
#include <wlr/render/pass.h>
#include <wlr/util/box.h>

struct workspace;
struct wlr_surface;
struct wlr_texture;

/* Client content: a window, layer or cursor surface */
struct texture_element {
	struct wlr_surface *surface;
	/* layout coordinates */
	struct wlr_box box;
};

/* Frame of @thickness drawn around (outside) @box */
struct border_element {
	struct wlr_box box;
	int thickness;
	float color[4];
};

/* Compositor-provided cursor image */
struct cursor_element {
	struct wlr_texture *texture;
	/* layout coordinates, logical size */
	struct wlr_box box;
};

using render_element = std::variant<texture_element, border_element,
	cursor_element>;

/* One surface of a layer-shell client */
struct layer_item {
	struct wlr_surface *surface;
	struct wlr_box box;
};

struct render_inputs {
	struct workspace *ws;
	/* output rectangle, layout coordinates */
	struct wlr_box output_box;
	/* background and bottom layers */
	std::vector<layer_item> lower;
	/* top and overlay layers */
	std::vector<layer_item> upper;
	/* exactly one of these is set when the cursor is on this output */
	struct wlr_texture *cursor_texture;
	struct wlr_surface *cursor_surface;
	struct wlr_box cursor_box;
};

/**
 * render_collect_elements() - elements to draw, bottom first
 *
 * Lower layers, then every window in stacking order (border, then its
 * surfaces), then upper layers, then the cursor. When the workspace
 * has a fullscreen window it is the only window and the upper layers
 * are left out. Elements outside the output are skipped.
 */
std::vector<render_element> render_collect_elements(
	const render_inputs &inputs);

/* Element rectangle in output buffer coordinates */
struct wlr_box render_element_geometry(const render_element &element,
	struct wlr_box output_box, float scale);

/* Add the element's rectangle to @damage (output buffer coordinates) */
void render_element_damage(const render_element &element,
	struct wlr_box output_box, float scale, pixman_region32_t *damage);

/* Draw the element, clipped to @clip */
void render_element_draw(const render_element &element,
	struct wlr_render_pass *pass, struct wlr_box output_box, float scale,
	const pixman_region32_t *clip);

/* Layout box to output buffer coordinates */
struct wlr_box render_scale_box(struct wlr_box box, struct wlr_box output_box,
	float scale);

#endif /* STACKWC_RENDER_H */
