// SPDX-License-Identifier: GPL-2.0-only
#include "output.h"
#include <assert.h>
#include <math.h>
#include <stdlib.h>
#include <time.h>
#include <drm_fourcc.h>
#include <wlr/backend/session.h>
#include <wlr/render/allocator.h>
#include <wlr/render/wlr_renderer.h>
#include <wlr/render/wlr_texture.h>
#include <wlr/types/wlr_compositor.h>
#include <wlr/types/wlr_cursor.h>
#include <wlr/types/wlr_layer_shell_v1.h>
#include <wlr/types/wlr_output_layout.h>
#include <wlr/types/wlr_xcursor_manager.h>
#include <wlr/util/log.h>
#include <wlr/util/region.h>
#include "buffer.h"
#include "common/alg.h"
#include "config/rcxml.h"
#include "device.h"
#include "layers.h"
#include "render.h"
#include "stackwc.h"
#include "xdg.h"

#define FALLBACK_CURSOR_SIZE 24

static const float clear_color[4] = { 0.1f, 0.1f, 0.1f, 1.0f };

static bool
box_equal(const struct wlr_box &a, const struct wlr_box &b)
{
	return a.x == b.x && a.y == b.y && a.width == b.width
		&& a.height == b.height;
}

struct wlr_box
output_layout_box(struct output *output)
{
	struct wlr_box box = {};
	wlr_output_layout_get_box(g_server.output_layout, output->wlr_output,
		&box);
	return box;
}

struct wlr_box
output_usable_area_in_layout_coords(struct output *output)
{
	struct wlr_box box = output_layout_box(output);
	box.x += output->usable_area.x;
	box.y += output->usable_area.y;
	box.width = output->usable_area.width;
	box.height = output->usable_area.height;
	return box;
}

struct output *
output_at(double lx, double ly)
{
	struct wlr_output *wlr_output =
		wlr_output_layout_output_at(g_server.output_layout, lx, ly);
	return wlr_output ? (struct output *)wlr_output->data : nullptr;
}

struct output *
output_nearest_to_cursor(void)
{
	if (g_seat.cursor) {
		struct output *output = output_at(g_seat.cursor->x,
			g_seat.cursor->y);
		if (output) {
			return output;
		}
	}
	return g_server.outputs.empty() ? nullptr : g_server.outputs[0];
}

static void
handle_schedule_idle(void *data)
{
	auto output = (struct output *)data;
	output->schedule_idle = nullptr;
	output->scheduler.schedule();
}

/* Repaint from the next loop iteration, once the current event is handled */
static void
schedule_repaint(struct output *output)
{
	if (!output->schedule_idle) {
		output->schedule_idle = wl_event_loop_add_idle(
			g_server.wl_event_loop, handle_schedule_idle, output);
	}
}

void
output_damage_whole(struct output *output)
{
	struct wlr_box box = {
		.x = 0,
		.y = 0,
		.width = output->wlr_output->width,
		.height = output->wlr_output->height,
	};
	wlr_damage_ring_add_box(&output->damage_ring, &box);
	schedule_repaint(output);
}

void
output_damage_all(void)
{
	for (auto output : g_server.outputs) {
		output_damage_whole(output);
	}
}

static void
damage_layout_box_on(struct output *output, struct wlr_box box)
{
	struct wlr_box output_box = output_layout_box(output);
	struct wlr_box intersection;
	if (!wlr_box_intersection(&intersection, &box, &output_box)) {
		return;
	}
	struct wlr_box damage = render_scale_box(intersection, output_box,
		output->wlr_output->scale);
	wlr_damage_ring_add_box(&output->damage_ring, &damage);
	schedule_repaint(output);
}

void
output_damage_layout_box(struct wlr_box box)
{
	for (auto output : g_server.outputs) {
		damage_layout_box_on(output, box);
	}
}

void
output_damage_surface(struct wlr_surface *surface, int lx, int ly)
{
	pixman_region32_t damage;
	pixman_region32_init(&damage);
	wlr_surface_get_effective_damage(surface, &damage);
	if (!pixman_region32_not_empty(&damage)) {
		pixman_region32_fini(&damage);
		return;
	}

	for (auto output : g_server.outputs) {
		struct wlr_box output_box = output_layout_box(output);
		struct wlr_box surface_box = {
			.x = lx,
			.y = ly,
			.width = surface->current.width,
			.height = surface->current.height,
		};
		struct wlr_box intersection;
		if (!wlr_box_intersection(&intersection, &surface_box,
				&output_box)) {
			continue;
		}

		float scale = output->wlr_output->scale;
		pixman_region32_t output_damage;
		pixman_region32_init(&output_damage);
		pixman_region32_copy(&output_damage, &damage);
		pixman_region32_translate(&output_damage, lx - output_box.x,
			ly - output_box.y);
		wlr_region_scale(&output_damage, &output_damage, scale);
		if (scale != (int)scale) {
			/* cover pixels only partially touched after scaling */
			wlr_region_expand(&output_damage, &output_damage, 1);
		}
		wlr_damage_ring_add(&output->damage_ring, &output_damage);
		pixman_region32_fini(&output_damage);
		schedule_repaint(output);
	}
	pixman_region32_fini(&damage);
}

/*
 * Cursor rectangle on @output in layout coordinates, and what to draw
 * there. False if there is no cursor to draw.
 */
static bool
cursor_box(struct output *output, struct wlr_box *box,
		struct wlr_texture **texture, struct wlr_surface **surface)
{
	*texture = nullptr;
	*surface = nullptr;
	if (!g_seat.cursor || g_seat.cursor_hidden) {
		return false;
	}
	int x = (int)g_seat.cursor->x;
	int y = (int)g_seat.cursor->y;

	if (g_seat.cursor_surface) {
		struct wlr_surface *cursor = g_seat.cursor_surface;
		if (!wlr_surface_has_buffer(cursor)) {
			return false;
		}
		*box = {
			.x = x - g_seat.cursor_hotspot_x,
			.y = y - g_seat.cursor_hotspot_y,
			.width = cursor->current.width,
			.height = cursor->current.height,
		};
		*surface = cursor;
		return true;
	}

	if (!output->cursor_texture) {
		return false;
	}
	float scale = output->wlr_output->scale;
	*box = {
		.x = x - (int)lroundf(output->cursor_hotspot_x / scale),
		.y = y - (int)lroundf(output->cursor_hotspot_y / scale),
		.width = (int)lroundf(output->cursor_width / scale),
		.height = (int)lroundf(output->cursor_height / scale),
	};
	*texture = output->cursor_texture;
	return true;
}

void
output_damage_cursor(void)
{
	for (auto output : g_server.outputs) {
		struct wlr_box box;
		struct wlr_texture *texture;
		struct wlr_surface *surface;
		if (cursor_box(output, &box, &texture, &surface)) {
			damage_layout_box_on(output, box);
		}
	}
}

void
output_enter_all(struct wlr_surface *surface)
{
	for (auto output : g_server.outputs) {
		if (!output->global_disabled) {
			wlr_surface_send_enter(surface, output->wlr_output);
		}
	}
}

void
output_leave_all(struct wlr_surface *surface)
{
	for (auto output : g_server.outputs) {
		wlr_surface_send_leave(surface, output->wlr_output);
	}
}

static bool
load_xcursor(struct output *output)
{
	float scale = output->wlr_output->scale;
	struct wlr_xcursor_manager *manager = g_seat.xcursor_manager;
	if (!manager || !wlr_xcursor_manager_load(manager, scale)) {
		return false;
	}
	struct wlr_xcursor *xcursor =
		wlr_xcursor_manager_get_xcursor(manager, XCURSOR_DEFAULT, scale);
	if (!xcursor || !xcursor->image_count) {
		return false;
	}
	struct wlr_xcursor_image *image = xcursor->images[0];
	output->cursor_texture = wlr_texture_from_pixels(g_server.renderer,
		DRM_FORMAT_ARGB8888, image->width * 4, image->width,
		image->height, image->buffer);
	if (!output->cursor_texture) {
		return false;
	}
	output->cursor_width = image->width;
	output->cursor_height = image->height;
	output->cursor_hotspot_x = image->hotspot_x;
	output->cursor_hotspot_y = image->hotspot_y;
	return true;
}

/* Plain arrow for systems without an xcursor theme */
static void
draw_fallback_cursor(struct output *output)
{
	float scale = output->wlr_output->scale;
	cairo_buffer *buffer = cairo_buffer_create(FALLBACK_CURSOR_SIZE,
		FALLBACK_CURSOR_SIZE, scale);
	if (!buffer) {
		return;
	}
	cairo_t *cairo = buffer->cairo;
	cairo_move_to(cairo, 1, 1);
	cairo_line_to(cairo, 1, 19);
	cairo_line_to(cairo, 6, 14);
	cairo_line_to(cairo, 10, 22);
	cairo_line_to(cairo, 13, 21);
	cairo_line_to(cairo, 9, 13);
	cairo_line_to(cairo, 16, 13);
	cairo_close_path(cairo);
	cairo_set_source_rgba(cairo, 0, 0, 0, 1);
	cairo_fill_preserve(cairo);
	cairo_set_source_rgba(cairo, 1, 1, 1, 1);
	cairo_set_line_width(cairo, 1);
	cairo_stroke(cairo);

	output->cursor_width = buffer->width;
	output->cursor_height = buffer->height;
	output->cursor_hotspot_x = (int)lroundf(scale);
	output->cursor_hotspot_y = (int)lroundf(scale);
	output->cursor_texture = cairo_buffer_finish(buffer, g_server.renderer);
	if (!output->cursor_texture) {
		wlr_log(WLR_ERROR, "%s: no cursor image", output->wlr_output->name);
	}
}

output::output(struct wlr_output *wlr_output, struct drm_device *device)
	: wlr_output(wlr_output), device(device),
	id(++g_server.next_output_id),
	scheduler(g_server.wl_event_loop, this)
{
	wlr_output->data = this;
	wlr_damage_ring_init(&damage_ring);
	scheduler.refresh_mhz = wlr_output->refresh;

	CONNECT_LISTENER(wlr_output, this, destroy);
	CONNECT_LISTENER(wlr_output, this, frame);
	CONNECT_LISTENER(wlr_output, this, present);
	CONNECT_LISTENER(wlr_output, this, needs_frame);

	if (!load_xcursor(this)) {
		draw_fallback_cursor(this);
	}

	usable_area = {};
	wlr_output_effective_resolution(wlr_output, &usable_area.width,
		&usable_area.height);

	g_server.outputs.push_back(this);
}

output::~output()
{
	wlr_log(WLR_INFO, "connector %s disconnected", wlr_output->name);
	swc::remove(g_server.outputs, this);

	layers_destroy_output(this);
	if (!global_disabled) {
		g_server.workspaces.unmap_output(id);
		wlr_output_layout_remove(g_server.output_layout, wlr_output);
	}

	if (schedule_idle) {
		wl_event_source_remove(schedule_idle);
	}
	if (cursor_texture) {
		wlr_texture_destroy(cursor_texture);
	}
	wlr_damage_ring_finish(&damage_ring);
	wlr_output->data = nullptr;
}

void
output_disable_global(struct output *output)
{
	if (output->global_disabled) {
		return;
	}
	output->global_disabled = true;
	wlr_output_layout_remove(g_server.output_layout, output->wlr_output);
	wlr_output_destroy_global(output->wlr_output);
}

const char *
output::target_name()
{
	return wlr_output->name;
}

static void
send_done_iterator(struct wlr_surface *surface, int sx, int sy, void *data)
{
	wlr_surface_send_frame_done(surface, (const struct timespec *)data);
}

void
output::send_frame_done(const struct timespec *now)
{
	if (!g_server.workspaces.workspaces.empty()) {
		for (auto &win : g_server.workspaces.current().windows) {
			win.client->for_each_surface(send_done_iterator,
				(void *)now);
		}
	}
	for (auto &layer : layers) {
		for (auto surface : layer) {
			if (surface->mapped) {
				wlr_layer_surface_v1_for_each_surface(
					surface->layer_surface,
					send_done_iterator, (void *)now);
			}
		}
	}
	if (g_seat.cursor_surface) {
		wlr_surface_send_frame_done(g_seat.cursor_surface, now);
	}
}

enum render_result
output::render_frame()
{
	if (!wlr_output->enabled || !g_server.session->active
			|| global_disabled) {
		return RENDER_DEVICE_INACTIVE;
	}

	if (!pixman_region32_not_empty(&damage_ring.current)) {
		/* nothing to show, but keep the clients' frame loops going */
		struct timespec now;
		clock_gettime(CLOCK_MONOTONIC, &now);
		send_frame_done(&now);
		return RENDER_NO_DAMAGE;
	}

	render_inputs inputs = {};
	if (!g_server.workspaces.workspaces.empty()) {
		inputs.ws = &g_server.workspaces.current();
	}
	inputs.output_box = output_layout_box(this);
	layers_collect(this, /* upper */ false, inputs.lower);
	layers_collect(this, /* upper */ true, inputs.upper);
	cursor_box(this, &inputs.cursor_box, &inputs.cursor_texture,
		&inputs.cursor_surface);
	std::vector<render_element> elements = render_collect_elements(inputs);

	struct wlr_output_state state;
	wlr_output_state_init(&state);

	pixman_region32_t frame_damage;
	pixman_region32_init(&frame_damage);
	pixman_region32_copy(&frame_damage, &damage_ring.current);

	struct wlr_render_pass *pass =
		wlr_output_begin_render_pass(wlr_output, &state, nullptr);
	if (!pass) {
		pixman_region32_fini(&frame_damage);
		wlr_output_state_finish(&state);
		return g_server.session->active
			? RENDER_FAILED : RENDER_DEVICE_INACTIVE;
	}

	/* damage accumulated since this buffer was last shown */
	pixman_region32_t buffer_damage;
	pixman_region32_init(&buffer_damage);
	wlr_damage_ring_rotate_buffer(&damage_ring, state.buffer,
		&buffer_damage);

	struct wlr_render_rect_options clear = {};
	clear.box = { 0, 0, wlr_output->width, wlr_output->height };
	clear.color = {
		.r = clear_color[0],
		.g = clear_color[1],
		.b = clear_color[2],
		.a = clear_color[3],
	};
	clear.clip = &buffer_damage;
	clear.blend_mode = WLR_RENDER_BLEND_MODE_NONE;
	wlr_render_pass_add_rect(pass, &clear);

	float scale = wlr_output->scale;
	for (auto &element : elements) {
		render_element_draw(element, pass, inputs.output_box, scale,
			&buffer_damage);
	}
	pixman_region32_fini(&buffer_damage);

	enum render_result result = RENDER_SUBMITTED;
	if (!wlr_render_pass_submit(pass)) {
		wlr_log(WLR_ERROR, "%s: render pass failed", wlr_output->name);
		result = RENDER_FAILED;
	} else {
		wlr_output_state_set_damage(&state, &frame_damage);
		if (!wlr_output_commit_state(wlr_output, &state)) {
			wlr_log(WLR_DEBUG, "%s: commit failed", wlr_output->name);
			result = g_server.session->active
				? RENDER_FAILED : RENDER_DEVICE_INACTIVE;
		}
	}
	pixman_region32_fini(&frame_damage);
	wlr_output_state_finish(&state);

	if (result != RENDER_SUBMITTED) {
		/* the contents of the next buffer are unknown */
		struct wlr_box whole = { 0, 0, wlr_output->width,
			wlr_output->height };
		wlr_damage_ring_add_box(&damage_ring, &whole);
	}
	return result;
}

void
output::handle_frame(void *)
{
	scheduler.on_vblank();
}

void
output::handle_present(void *data)
{
	auto event = (struct wlr_output_event_present *)data;
	struct timespec now;
	clock_gettime(CLOCK_MONOTONIC, &now);
	if (!event->presented) {
		scheduler.on_dropped(&now);
		return;
	}
	scheduler.on_present(&now);
}

void
output::handle_needs_frame(void *)
{
	output_damage_whole(this);
}

static struct wlr_output_mode *
find_mode(struct wlr_output *wlr_output, int width, int height,
		int refresh_mhz)
{
	struct wlr_output_mode *mode, *best = nullptr;
	wl_list_for_each(mode, &wlr_output->modes, link) {
		if (mode->width != width || mode->height != height) {
			continue;
		}
		if (refresh_mhz <= 0) {
			if (!best || mode->preferred
					|| (!best->preferred
						&& mode->refresh > best->refresh)) {
				best = mode;
			}
			continue;
		}
		if (abs(mode->refresh - refresh_mhz) <= 1000) {
			return mode;
		}
	}
	return best;
}

/* Returns true if a custom mode was requested */
static bool
configure_mode(struct wlr_output *wlr_output, struct wlr_output_state *state,
		const struct output_config *config)
{
	struct wlr_output_mode *mode = wlr_output_preferred_mode(wlr_output);
	if (!mode && !wl_list_empty(&wlr_output->modes)) {
		mode = wl_container_of(wlr_output->modes.next, mode, link);
	}

	if (config && config->width > 0 && config->height > 0) {
		int refresh_mhz = config->refresh * 1000;
		struct wlr_output_mode *configured = find_mode(wlr_output,
			config->width, config->height, refresh_mhz);
		if (configured) {
			mode = configured;
		} else {
			wlr_log(WLR_INFO, "%s: requesting custom mode %dx%d@%d",
				wlr_output->name, config->width, config->height,
				config->refresh);
			wlr_output_state_set_custom_mode(state, config->width,
				config->height, refresh_mhz);
			return true;
		}
	}

	/* no modes advertised, e.g. a virtual connector */
	if (mode) {
		wlr_output_state_set_mode(state, mode);
	}
	return false;
}

static bool
enable_output(struct wlr_output *wlr_output, const struct output_config *config)
{
	struct wlr_output_state state;
	wlr_output_state_init(&state);
	wlr_output_state_set_enabled(&state, true);

	bool custom = configure_mode(wlr_output, &state, config);
	if (config && config->scale > 0) {
		wlr_output_state_set_scale(&state, config->scale);
	}

	bool committed = wlr_output_commit_state(wlr_output, &state);
	if (!committed && custom) {
		wlr_log(WLR_ERROR, "%s: custom mode rejected, using the "
			"preferred mode", wlr_output->name);
		configure_mode(wlr_output, &state, nullptr);
		committed = wlr_output_commit_state(wlr_output, &state);
	}
	wlr_output_state_finish(&state);
	return committed;
}

struct output *
output_create(struct wlr_output *wlr_output, struct drm_device *device)
{
	const struct output_config *config =
		rcxml_output_config(wlr_output->name);
	if (config && !config->enabled) {
		wlr_log(WLR_INFO, "%s is disabled in rc.xml", wlr_output->name);
		return nullptr;
	}
	if (!g_server.renderer || !g_server.allocator) {
		wlr_log(WLR_ERROR, "%s: no renderer", wlr_output->name);
		return nullptr;
	}
	if (!wlr_output_init_render(wlr_output, g_server.allocator,
			g_server.renderer)) {
		wlr_log(WLR_ERROR, "%s: unable to initialize rendering",
			wlr_output->name);
		return nullptr;
	}
	if (!enable_output(wlr_output, config)) {
		wlr_log(WLR_ERROR, "%s: unable to enable", wlr_output->name);
		return nullptr;
	}

	auto output = new struct output(wlr_output, device);

	struct wlr_output_layout_output *layout_output;
	if (config && config->has_position) {
		layout_output = wlr_output_layout_add(g_server.output_layout,
			wlr_output, config->x, config->y);
	} else {
		layout_output = wlr_output_layout_add_auto(
			g_server.output_layout, wlr_output);
	}
	if (!layout_output) {
		wlr_log(WLR_ERROR, "%s: unable to add to the layout",
			wlr_output->name);
		wlr_output_destroy_global(wlr_output);
		output->global_disabled = true;
		return output;
	}

	struct wlr_box box = output_layout_box(output);
	wlr_log(WLR_INFO, "%s: %dx%d@%d.%03d scale %.2f at %d,%d",
		wlr_output->name, wlr_output->width, wlr_output->height,
		wlr_output->refresh / 1000, wlr_output->refresh % 1000,
		wlr_output->scale, box.x, box.y);

	g_server.workspaces.map_output(output->id, wlr_output->name, box);
	output_update_usable_area(output);
	xdg_windows_enter_outputs();

	if (!g_server.session->active) {
		output->scheduler.pause();
	}
	output_damage_whole(output);
	/* first frame right away */
	output->scheduler.schedule();
	return output;
}

void
output_update_usable_area(struct output *output)
{
	struct wlr_box usable = layers_arrange(output);
	if (!box_equal(usable, output->usable_area)) {
		output->usable_area = usable;
		if (!output->global_disabled) {
			g_server.workspaces.update_output_area(output->id,
				output_usable_area_in_layout_coords(output));
		}
	}
	output_damage_whole(output);
}

static void
handle_new_surface(struct wl_listener *listener, void *data);

void
output_init(void)
{
	g_server.output_layout = wlr_output_layout_create(g_server.wl_display);
	if (!g_server.output_layout) {
		wlr_log(WLR_ERROR, "unable to create output layout");
		exit(EXIT_FAILURE);
	}

	g_server.new_surface.notify = handle_new_surface;
	wl_signal_add(&g_server.compositor->events.new_surface,
		&g_server.new_surface);
}

void
output_finish(void)
{
	wl_list_remove(&g_server.new_surface.link);
	wlr_output_layout_destroy(g_server.output_layout);
	g_server.output_layout = nullptr;
}

/* Turns surface commits into output damage */
struct surface_damage : public destroyable {
	struct wlr_surface *surface;

	DECLARE_HANDLER(surface_damage, commit);
};

void
surface_damage::handle_commit(void *)
{
	if (surface == g_seat.cursor_surface) {
		/* size and hotspot may have changed too */
		output_damage_cursor();
		return;
	}
	if (xdg_damage_surface(surface)) {
		return;
	}
	if (!wlr_surface_get_root_surface(surface)->mapped) {
		return;
	}
	/* layer surfaces and everything else */
	output_damage_all();
}

static void
handle_new_surface(struct wl_listener *listener, void *data)
{
	auto surface = (struct wlr_surface *)data;
	auto damage = new surface_damage();
	damage->surface = surface;
	CONNECT_LISTENER(surface, damage, destroy);
	CONNECT_LISTENER(surface, damage, commit);
}
