// SPDX-License-Identifier: GPL-2.0-only
#include "common/edge.h"
#include <strings.h>
#include <wlr/types/wlr_output_layout.h>
#include <wlr/util/edges.h>

static_assert((int)SWC_EDGE_TOP == (int)WLR_EDGE_TOP
		&& (int)SWC_EDGE_BOTTOM == (int)WLR_EDGE_BOTTOM
		&& (int)SWC_EDGE_LEFT == (int)WLR_EDGE_LEFT
		&& (int)SWC_EDGE_RIGHT == (int)WLR_EDGE_RIGHT,
	"enum swc_edge does not match enum wlr_edges");

static_assert((int)SWC_EDGE_TOP == (int)WLR_DIRECTION_UP
		&& (int)SWC_EDGE_BOTTOM == (int)WLR_DIRECTION_DOWN
		&& (int)SWC_EDGE_LEFT == (int)WLR_DIRECTION_LEFT
		&& (int)SWC_EDGE_RIGHT == (int)WLR_DIRECTION_RIGHT,
	"enum swc_edge does not match enum wlr_direction");

enum swc_edge
swc_edge_parse(const char *direction)
{
	if (!direction) {
		return SWC_EDGE_NONE;
	}
	if (!strcasecmp(direction, "left")) {
		return SWC_EDGE_LEFT;
	} else if (!strcasecmp(direction, "up")) {
		return SWC_EDGE_TOP;
	} else if (!strcasecmp(direction, "right")) {
		return SWC_EDGE_RIGHT;
	} else if (!strcasecmp(direction, "down")) {
		return SWC_EDGE_BOTTOM;
	} else {
		return SWC_EDGE_NONE;
	}
}

const char *
swc_edge_name(enum swc_edge edge)
{
	switch (edge) {
	case SWC_EDGE_LEFT:
		return "left";
	case SWC_EDGE_RIGHT:
		return "right";
	case SWC_EDGE_TOP:
		return "up";
	case SWC_EDGE_BOTTOM:
		return "down";
	default:
		return "none";
	}
}

bool
swc_edge_is_cardinal(enum swc_edge edge)
{
	switch (edge) {
	case SWC_EDGE_TOP:
	case SWC_EDGE_BOTTOM:
	case SWC_EDGE_LEFT:
	case SWC_EDGE_RIGHT:
		return true;
	default:
		return false;
	}
}

enum swc_edge
swc_edge_invert(enum swc_edge edge)
{
	switch (edge) {
	case SWC_EDGE_LEFT:
		return SWC_EDGE_RIGHT;
	case SWC_EDGE_RIGHT:
		return SWC_EDGE_LEFT;
	case SWC_EDGE_TOP:
		return SWC_EDGE_BOTTOM;
	case SWC_EDGE_BOTTOM:
		return SWC_EDGE_TOP;
	default:
		return SWC_EDGE_NONE;
	}
}
