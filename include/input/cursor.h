/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_CURSOR_H
#define STACKWC_CURSOR_H

#include <stdint.h>

void cursor_init(void);
void cursor_finish(void);

/*
 * Re-run pointer focus at the current position: the window under the
 * cursor becomes active and the surface under it gets pointer focus.
 * Does nothing during interactive move/resize.
 */
void cursor_update_focus(void);

/* Move the cursor to a layout position and update focus */
void cursor_warp(double lx, double ly);

/* Forget a client cursor image and go back to the default one */
void cursor_reset_image(void);

#endif /* STACKWC_CURSOR_H */
