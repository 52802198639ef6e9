// SPDX-License-Identifier: GPL-2.0-only
#include "layout.h"

static std::vector<placement>
place_master_stack(const std::vector<struct toplevel *> &windows,
		struct wlr_box area)
{
	std::vector<placement> result;
	size_t count = windows.size();
	if (!count) {
		return result;
	}
	if (count == 1) {
		result.push_back({windows[0], area});
		return result;
	}

	int half = area.width / 2;
	int stack_height = area.height / (int)(count - 1);

	result.push_back({windows[0], {
		.x = area.x,
		.y = area.y,
		.width = half,
		.height = area.height,
	}});

	for (size_t i = 1; i < count; i++) {
		result.push_back({windows[i], {
			.x = area.x + half,
			.y = area.y + stack_height * (int)(i - 1),
			.width = half,
			.height = stack_height,
		}});
	}
	return result;
}

std::vector<placement>
layout_place(const layout &layout,
		const std::vector<struct toplevel *> &windows, struct wlr_box area)
{
	if (std::holds_alternative<master_stack_layout>(layout)) {
		return place_master_stack(windows, area);
	}
	return {};
}

const char *
layout_name(const layout &layout)
{
	if (std::holds_alternative<master_stack_layout>(layout)) {
		return "master-stack";
	}
	return "unknown";
}
