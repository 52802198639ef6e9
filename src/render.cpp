// SPDX-License-Identifier: GPL-2.0-only
#include "render.h"
#include <math.h>
#include <string.h>
#include <type_traits>
#include <wlr/render/wlr_texture.h>
#include <wlr/types/wlr_compositor.h>
#include "config/rcxml.h"
#include "workspaces.h"

struct wlr_box
render_scale_box(struct wlr_box box, struct wlr_box output_box, float scale)
{
	/* Round the edges, not the size, so that adjacent boxes meet */
	int x1 = lround((box.x - output_box.x) * scale);
	int y1 = lround((box.y - output_box.y) * scale);
	int x2 = lround((box.x + box.width - output_box.x) * scale);
	int y2 = lround((box.y + box.height - output_box.y) * scale);
	return {
		.x = x1,
		.y = y1,
		.width = x2 - x1,
		.height = y2 - y1,
	};
}

static bool
on_output(struct wlr_box box, struct wlr_box output_box)
{
	struct wlr_box intersection;
	return wlr_box_intersection(&intersection, &box, &output_box);
}

static void
add_layer_items(std::vector<render_element> &elements,
		const std::vector<layer_item> &items, struct wlr_box output_box)
{
	for (auto &item : items) {
		if (item.surface && on_output(item.box, output_box)) {
			elements.push_back(texture_element{item.surface, item.box});
		}
	}
}

struct surface_collector {
	std::vector<render_element> *elements;
	struct wlr_box geometry;
	struct wlr_box output_box;
};

static void
collect_surface(struct wlr_surface *surface, int sx, int sy, void *data)
{
	auto collector = static_cast<surface_collector *>(data);
	struct wlr_box box = {
		.x = collector->geometry.x + sx,
		.y = collector->geometry.y + sy,
		.width = surface->current.width,
		.height = surface->current.height,
	};
	if (on_output(box, collector->output_box)) {
		collector->elements->push_back(texture_element{surface, box});
	}
}

static void
add_window(std::vector<render_element> &elements, workspace &ws,
		window &win, struct wlr_box output_box)
{
	if (win.mode != WINDOW_MODE_FULLSCREEN && rc.border_thickness > 0) {
		border_element border = {
			.box = win.geometry,
			.thickness = rc.border_thickness,
		};
		const float *color = (ws.active == win.client)
			? rc.active_border_color : rc.inactive_border_color;
		memcpy(border.color, color, sizeof(border.color));
		struct wlr_box outer = {
			.x = border.box.x - border.thickness,
			.y = border.box.y - border.thickness,
			.width = border.box.width + 2 * border.thickness,
			.height = border.box.height + 2 * border.thickness,
		};
		if (on_output(outer, output_box)) {
			elements.push_back(border);
		}
	}

	surface_collector collector = {
		.elements = &elements,
		.geometry = win.geometry,
		.output_box = output_box,
	};
	win.client->for_each_surface(collect_surface, &collector);
}

std::vector<render_element>
render_collect_elements(const render_inputs &inputs)
{
	std::vector<render_element> elements;
	struct wlr_box output_box = inputs.output_box;

	add_layer_items(elements, inputs.lower, output_box);

	bool fullscreen = false;
	if (inputs.ws) {
		fullscreen = inputs.ws->fullscreen_window();
		for (window *win : inputs.ws->stacking_order()) {
			add_window(elements, *inputs.ws, *win, output_box);
		}
	}

	if (!fullscreen) {
		add_layer_items(elements, inputs.upper, output_box);
	}

	if (inputs.cursor_surface) {
		if (on_output(inputs.cursor_box, output_box)) {
			elements.push_back(texture_element{
				inputs.cursor_surface, inputs.cursor_box});
		}
	} else if (inputs.cursor_texture) {
		if (on_output(inputs.cursor_box, output_box)) {
			elements.push_back(cursor_element{
				inputs.cursor_texture, inputs.cursor_box});
		}
	}
	return elements;
}

/* The four sides of a border, layout coordinates */
static void
border_sides(const border_element &border, struct wlr_box sides[4])
{
	const struct wlr_box &b = border.box;
	int t = border.thickness;
	sides[0] = { b.x - t, b.y - t, b.width + 2 * t, t };      /* top */
	sides[1] = { b.x - t, b.y + b.height, b.width + 2 * t, t }; /* bottom */
	sides[2] = { b.x - t, b.y, t, b.height };                 /* left */
	sides[3] = { b.x + b.width, b.y, t, b.height };           /* right */
}

struct wlr_box
render_element_geometry(const render_element &element,
		struct wlr_box output_box, float scale)
{
	if (auto texture = std::get_if<texture_element>(&element)) {
		return render_scale_box(texture->box, output_box, scale);
	} else if (auto border = std::get_if<border_element>(&element)) {
		struct wlr_box outer = {
			.x = border->box.x - border->thickness,
			.y = border->box.y - border->thickness,
			.width = border->box.width + 2 * border->thickness,
			.height = border->box.height + 2 * border->thickness,
		};
		return render_scale_box(outer, output_box, scale);
	} else if (auto cursor = std::get_if<cursor_element>(&element)) {
		return render_scale_box(cursor->box, output_box, scale);
	}
	return {};
}

void
render_element_damage(const render_element &element,
		struct wlr_box output_box, float scale, pixman_region32_t *damage)
{
	if (auto border = std::get_if<border_element>(&element)) {
		struct wlr_box sides[4];
		border_sides(*border, sides);
		for (auto &side : sides) {
			struct wlr_box box = render_scale_box(side, output_box, scale);
			pixman_region32_union_rect(damage, damage, box.x, box.y,
				box.width, box.height);
		}
		return;
	}
	struct wlr_box box = render_element_geometry(element, output_box, scale);
	pixman_region32_union_rect(damage, damage, box.x, box.y,
		box.width, box.height);
}

static void
draw_texture(const texture_element &element, struct wlr_render_pass *pass,
		struct wlr_box output_box, float scale, const pixman_region32_t *clip)
{
	struct wlr_texture *texture = wlr_surface_get_texture(element.surface);
	if (!texture) {
		return;
	}
	struct wlr_fbox src_box;
	wlr_surface_get_buffer_source_box(element.surface, &src_box);

	struct wlr_render_texture_options options = {};
	options.texture = texture;
	options.src_box = src_box;
	options.dst_box = render_scale_box(element.box, output_box, scale);
	options.clip = clip;
	options.transform = element.surface->current.transform;
	options.filter_mode = WLR_SCALE_FILTER_BILINEAR;
	wlr_render_pass_add_texture(pass, &options);
}

static void
draw_border(const border_element &element, struct wlr_render_pass *pass,
		struct wlr_box output_box, float scale, const pixman_region32_t *clip)
{
	struct wlr_box sides[4];
	border_sides(element, sides);
	for (auto &side : sides) {
		struct wlr_render_rect_options options = {};
		options.box = render_scale_box(side, output_box, scale);
		options.color = {
			.r = element.color[0],
			.g = element.color[1],
			.b = element.color[2],
			.a = element.color[3],
		};
		options.clip = clip;
		wlr_render_pass_add_rect(pass, &options);
	}
}

static void
draw_cursor(const cursor_element &element, struct wlr_render_pass *pass,
		struct wlr_box output_box, float scale, const pixman_region32_t *clip)
{
	struct wlr_render_texture_options options = {};
	options.texture = element.texture;
	options.dst_box = render_scale_box(element.box, output_box, scale);
	options.clip = clip;
	options.filter_mode = WLR_SCALE_FILTER_BILINEAR;
	wlr_render_pass_add_texture(pass, &options);
}

void
render_element_draw(const render_element &element,
		struct wlr_render_pass *pass, struct wlr_box output_box, float scale,
		const pixman_region32_t *clip)
{
	std::visit([&](auto &e) {
		using T = std::decay_t<decltype(e)>;
		if constexpr (std::is_same_v<T, texture_element>) {
			draw_texture(e, pass, output_box, scale, clip);
		} else if constexpr (std::is_same_v<T, border_element>) {
			draw_border(e, pass, output_box, scale, clip);
		} else {
			draw_cursor(e, pass, output_box, scale, clip);
		}
	}, element);
}
