/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_LAYOUT_H
#define STACKWC_LAYOUT_H

#include <variant>
#include <vector>
#include <wlr/util/box.h>

struct toplevel;

/*
 * Master-stack: the first window takes the left half of the area (all
 * of it when alone), the others share the right half in equal-height
 * rows.
 */
struct master_stack_layout {};

/* Tiling algorithms. Add new ones as alternatives here. */
using layout = std::variant<master_stack_layout>;

struct placement {
	struct toplevel *client;
	struct wlr_box box;
};

/**
 * layout_place() - compute the target rectangle of every window
 * @layout: algorithm to use
 * @windows: windows in tiling order
 * @area: rectangle to fill, in layout coordinates
 *
 * Pure: identical arguments give identical results. Returns one
 * placement per window, in the same order.
 */
std::vector<placement> layout_place(const layout &layout,
	const std::vector<struct toplevel *> &windows, struct wlr_box area);

const char *layout_name(const layout &layout);

#endif /* STACKWC_LAYOUT_H */
