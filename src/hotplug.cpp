// SPDX-License-Identifier: GPL-2.0-only
#include "hotplug.h"
#include <wlr/util/log.h>

std::vector<uint32_t>
hotplug_remove_device(workspace_manager &workspaces,
		const std::vector<hotplug_output> &outputs, dev_t device)
{
	std::vector<uint32_t> removed;
	for (auto &output : outputs) {
		if (output.device != device) {
			continue;
		}
		output.scheduler->pause();
		workspaces.unmap_output(output.id);
		removed.push_back(output.id);
	}
	wlr_log(WLR_DEBUG, "device removal unmapped %zu output(s)",
		removed.size());
	return removed;
}

void
hotplug_session_paused(const std::vector<hotplug_output> &outputs)
{
	for (auto &output : outputs) {
		output.scheduler->pause();
	}
}

void
hotplug_session_resumed(const std::vector<hotplug_output> &outputs)
{
	for (auto &output : outputs) {
		struct wlr_box box = {
			.x = 0,
			.y = 0,
			.width = output.width,
			.height = output.height,
		};
		wlr_damage_ring_add_box(output.damage, &box);
		output.scheduler->resume();
	}
}
