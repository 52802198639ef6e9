/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_INPUT_H
#define STACKWC_INPUT_H

#include <wayland-server-core.h>
#include "common/listener.h"

/*
 * A keyboard or pointer reported by the backend. Deleted when the
 * wlr_input_device is destroyed.
 */
struct input : public destroyable {
	struct wlr_input_device *wlr_input_device = nullptr;

	virtual ~input();
};

/* Start listening for new devices and set up the cursor and keyboards */
void inputs_init(void);
void inputs_finish(void);

#endif /* STACKWC_INPUT_H */
