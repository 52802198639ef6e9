/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_OUTPUT_H
#define STACKWC_OUTPUT_H

#include <vector>
#include <wlr/types/wlr_damage_ring.h>
#include <wlr/types/wlr_output.h>
#include "common/listener.h"
#include "frame-scheduler.h"

#define SWC_NR_LAYERS (4)

struct drm_device;
struct swc_layer_surface;

/*
 * Render surface of one connector. Lives from "connected" (the DRM
 * backend announcing a new wlr_output) to "disconnected" (the
 * wlr_output being destroyed).
 */
struct output : public destroyable, public frame_target {
	struct wlr_output *wlr_output;
	struct drm_device *device;
	/* unique for the lifetime of the process, used by the workspaces */
	uint32_t id;

	/* in output buffer coordinates */
	struct wlr_damage_ring damage_ring;
	frame_scheduler scheduler;
	/* deferred schedule() after damage */
	struct wl_event_source *schedule_idle = nullptr;

	/* indexed by zwlr_layer_shell_v1_layer */
	std::vector<swc_layer_surface *> layers[SWC_NR_LAYERS];
	/* In output-relative coordinates */
	struct wlr_box usable_area;

	/* default cursor image at the output scale */
	struct wlr_texture *cursor_texture = nullptr;
	int cursor_width = 0;
	int cursor_height = 0;
	int cursor_hotspot_x = 0;
	int cursor_hotspot_y = 0;

	/* global withdrawn because the device is being removed */
	bool global_disabled = false;

	output(struct wlr_output *wlr_output, struct drm_device *device);
	~output();

	enum render_result render_frame() override;
	void send_frame_done(const struct timespec *now) override;
	const char *target_name() override;

	DECLARE_HANDLER(output, frame);
	DECLARE_HANDLER(output, present);
	DECLARE_HANDLER(output, needs_frame);
};

void output_init(void);
void output_finish(void);

/*
 * Configure a newly connected wlr_output (mode, scale, position) and
 * start rendering to it. Returns NULL, leaving the connector unused,
 * if it is disabled in rc.xml or cannot be enabled.
 */
struct output *output_create(struct wlr_output *wlr_output,
	struct drm_device *device);

/*
 * Withdraw the wl_output global and leave the output layout. The caller
 * unmaps it from the workspaces (see hotplug_remove_device()).
 */
void output_disable_global(struct output *output);

struct output *output_at(double lx, double ly);
struct output *output_nearest_to_cursor(void);

struct wlr_box output_layout_box(struct output *output);
struct wlr_box output_usable_area_in_layout_coords(struct output *output);
void output_update_usable_area(struct output *output);

/* Add damage in layout coordinates and schedule a repaint */
void output_damage_whole(struct output *output);
void output_damage_all(void);
void output_damage_layout_box(struct wlr_box box);
/* Effective damage of a surface drawn with its origin at (@lx, @ly) */
void output_damage_surface(struct wlr_surface *surface, int lx, int ly);
/* Damage the cursor image on every output */
void output_damage_cursor(void);

/* Send wl_surface.enter (or leave) for every output */
void output_enter_all(struct wlr_surface *surface);
void output_leave_all(struct wlr_surface *surface);

#endif /* STACKWC_OUTPUT_H */
