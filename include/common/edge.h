/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_EDGE_H
#define STACKWC_EDGE_H

#include <stdbool.h>

/*
 * Edges of a box, also used as directions. Values match
 * enum wlr_edges and enum wlr_direction (checked in edge.cpp).
 */
enum swc_edge {
	SWC_EDGE_NONE = 0,
	SWC_EDGE_TOP = (1 << 0),
	SWC_EDGE_BOTTOM = (1 << 1),
	SWC_EDGE_LEFT = (1 << 2),
	SWC_EDGE_RIGHT = (1 << 3),
};

static inline swc_edge
operator|(swc_edge a, swc_edge b)
{
	return (swc_edge)((int)a | (int)b);
}

static inline swc_edge &
operator|=(swc_edge &a, swc_edge b)
{
	return a = a | b;
}

/* Accepts "left", "right", "up" and "down" (case-insensitive) */
enum swc_edge swc_edge_parse(const char *direction);
const char *swc_edge_name(enum swc_edge edge);
bool swc_edge_is_cardinal(enum swc_edge edge);
enum swc_edge swc_edge_invert(enum swc_edge edge);

#endif /* STACKWC_EDGE_H */
