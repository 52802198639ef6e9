/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_DEVICE_H
#define STACKWC_DEVICE_H

#include <sys/types.h>
#include "common/listener.h"
#include "common/str.h"
#include "intent.h"

/*
 * One GPU (DRM card) and the DRM backend driving its connectors.
 *
 * The first device added is the primary: it owns the renderer and
 * allocator shared by every output. Secondary devices are created with
 * the primary backend as parent and use the multi-GPU copy path.
 */
struct drm_device {
	dev_t dev;
	swc_str path;
	/* freed by the backend when the device goes away */
	struct wlr_device *wlr_device = nullptr;
	struct wlr_backend *backend = nullptr;
	bool primary = false;
	/* set once the kernel reported the device as removed */
	bool removed = false;

	/* primary only */
	struct wlr_renderer *renderer = nullptr;
	struct wlr_allocator *allocator = nullptr;

	~drm_device();

	DECLARE_HANDLER(drm_device, change);
	DECLARE_HANDLER(drm_device, remove);
	DECLARE_HANDLER(drm_device, new_output);
	DECLARE_HANDLER(drm_device, backend_destroy);
	DECLARE_HANDLER(drm_device, renderer_lost);
};

/*
 * Open @path and start driving it. The first device added becomes the
 * primary. Returns NULL (after logging) if the device is already known,
 * cannot be opened or has no usable DRM backend.
 */
struct drm_device *device_add(const char *path);

struct drm_device *device_primary(void);
struct drm_device *device_from_dev(dev_t dev);

/* Add the GPUs present at startup, exits if there is none */
void devices_init(void);
void devices_finish(void);

/* Session paused (VT switched away) or resumed */
void devices_handle_session_active(bool active);

/* Handler of g_server.intents */
void devices_handle_intent(const intent &intent, void *data);

#endif /* STACKWC_DEVICE_H */
