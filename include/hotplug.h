/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_HOTPLUG_H
#define STACKWC_HOTPLUG_H

#include <stdint.h>
#include <sys/types.h>
#include <vector>
#include <wlr/types/wlr_damage_ring.h>
#include "frame-scheduler.h"
#include "workspaces.h"

/* A live output as the device registry tracks it */
struct hotplug_output {
	uint32_t id;
	/* the DRM device driving the connector */
	dev_t device;
	frame_scheduler *scheduler;
	/* in output buffer coordinates */
	struct wlr_damage_ring *damage;
	int width;
	int height;
};

/*
 * hotplug_remove_device() - forget the outputs of a vanished device
 *
 * Every output driven by @device is unmapped from all workspaces and
 * its scheduler paused. Outputs of other devices keep their mapping and
 * keep repainting. Returns the ids of the outputs removed.
 */
std::vector<uint32_t> hotplug_remove_device(workspace_manager &workspaces,
	const std::vector<hotplug_output> &outputs, dev_t device);

/* VT switched away: stop repainting until resumed */
void hotplug_session_paused(const std::vector<hotplug_output> &outputs);

/*
 * VT switched back. Damage tracked before the pause is stale, so each
 * output is damaged as a whole before its scheduler repaints.
 */
void hotplug_session_resumed(const std::vector<hotplug_output> &outputs);

#endif /* STACKWC_HOTPLUG_H */
