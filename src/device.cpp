// SPDX-License-Identifier: GPL-2.0-only
#include "device.h"
#include <assert.h>
#include <stdlib.h>
#include <sys/sysmacros.h>
#include <xf86drm.h>
#include <wlr/backend/drm.h>
#include <wlr/backend/multi.h>
#include <wlr/backend/session.h>
#include <wlr/render/allocator.h>
#include <wlr/render/wlr_renderer.h>
#include <wlr/types/wlr_compositor.h>
#include <wlr/util/log.h>
#include "common/alg.h"
#include "hotplug.h"
#include "output.h"
#include "stackwc.h"

#define MAX_GPUS 8

struct drm_device *
device_primary(void)
{
	if (g_server.devices.empty() || !g_server.devices[0]->primary) {
		return nullptr;
	}
	return g_server.devices[0];
}

struct drm_device *
device_from_dev(dev_t dev)
{
	for (auto device : g_server.devices) {
		if (device->dev == dev) {
			return device;
		}
	}
	return nullptr;
}

static struct drm_device *
device_from_path(const char *path)
{
	for (auto device : g_server.devices) {
		if (device->path == path) {
			return device;
		}
	}
	return nullptr;
}

/* Outputs still advertised to clients */
static std::vector<hotplug_output>
live_outputs(void)
{
	std::vector<hotplug_output> outputs;
	for (auto output : g_server.outputs) {
		if (output->global_disabled) {
			continue;
		}
		outputs.push_back({
			.id = output->id,
			.device = output->device->dev,
			.scheduler = &output->scheduler,
			.damage = &output->damage_ring,
			.width = output->wlr_output->width,
			.height = output->wlr_output->height,
		});
	}
	return outputs;
}

static void
disable_outputs(struct drm_device *device)
{
	auto removed = hotplug_remove_device(g_server.workspaces,
		live_outputs(), device->dev);
	for (auto output : g_server.outputs) {
		if (swc::contains(removed, output->id)) {
			output_disable_global(output);
		}
	}
}

static bool
create_renderer(struct drm_device *device)
{
	device->renderer = wlr_renderer_autocreate(device->backend);
	if (!device->renderer) {
		wlr_log(WLR_ERROR, "unable to create renderer for %s",
			device->path.c());
		return false;
	}
	device->allocator =
		wlr_allocator_autocreate(device->backend, device->renderer);
	if (!device->allocator) {
		wlr_log(WLR_ERROR, "unable to create allocator for %s",
			device->path.c());
		wlr_renderer_destroy(device->renderer);
		device->renderer = nullptr;
		return false;
	}
	device->on_renderer_lost.connect(&device->renderer->events.lost);

	g_server.renderer = device->renderer;
	g_server.allocator = device->allocator;

	if (!g_server.renderer_globals_created) {
		if (!wlr_renderer_init_wl_display(device->renderer,
				g_server.wl_display)) {
			wlr_log(WLR_ERROR, "unable to initialize shm/dmabuf");
		}
		g_server.renderer_globals_created = true;
	}
	if (g_server.compositor) {
		wlr_compositor_set_renderer(g_server.compositor,
			device->renderer);
	}
	return true;
}

/* Takes ownership of @wlr_device */
static struct drm_device *
device_create(struct wlr_device *wlr_device, const char *path)
{
	struct drm_device *primary = device_primary();

	auto device = new drm_device();
	device->dev = wlr_device->dev;
	device->path = swc_str(path);
	device->wlr_device = wlr_device;
	device->primary = !primary;

	/*
	 * Connected before the DRM backend exists, so that on removal
	 * our handler runs ahead of the backend destroying itself.
	 */
	CONNECT_LISTENER(wlr_device, device, change);
	CONNECT_LISTENER(wlr_device, device, remove);

	device->backend = wlr_drm_backend_create(g_server.session, wlr_device,
		primary ? primary->backend : nullptr);
	if (!device->backend) {
		wlr_log(WLR_ERROR, "%s has no usable DRM backend", path);
		device->on_change.disconnect();
		device->on_remove.disconnect();
		wlr_session_close_file(g_server.session, wlr_device);
		device->wlr_device = nullptr;
		delete device;
		return nullptr;
	}
	device->on_backend_destroy.connect(&device->backend->events.destroy);
	CONNECT_LISTENER(device->backend, device, new_output);

	if (device->primary && !create_renderer(device)) {
		delete device;
		return nullptr;
	}

	if (device->primary) {
		g_server.devices.insert(g_server.devices.begin(), device);
	} else {
		g_server.devices.push_back(device);
	}

	if (!wlr_multi_backend_add(g_server.backend, device->backend)) {
		wlr_log(WLR_ERROR, "unable to add %s to the backend", path);
		delete device;
		return nullptr;
	}
	/* at startup the multi-backend starts it */
	if (g_server.backend_started && !wlr_backend_start(device->backend)) {
		wlr_log(WLR_ERROR, "unable to start the backend of %s", path);
		delete device;
		return nullptr;
	}

	wlr_log(WLR_INFO, "added %s device %s (%u:%u)",
		device->primary ? "primary" : "secondary", path,
		major(device->dev), minor(device->dev));
	return device;
}

struct drm_device *
device_add(const char *path)
{
	if (device_from_path(path)) {
		wlr_log(WLR_DEBUG, "%s already added", path);
		return nullptr;
	}
	struct wlr_device *wlr_device =
		wlr_session_open_file(g_server.session, path);
	if (!wlr_device) {
		wlr_log(WLR_ERROR, "unable to open %s", path);
		return nullptr;
	}
	return device_create(wlr_device, path);
}

drm_device::~drm_device()
{
	swc::remove(g_server.devices, this);

	on_change.disconnect();
	on_remove.disconnect();
	on_new_output.disconnect();

	if (backend) {
		on_backend_destroy.disconnect();
		/* also destroys the outputs and closes the device file */
		wlr_backend_destroy(backend);
		backend = nullptr;
	}
	wlr_device = nullptr;

	if (allocator) {
		if (g_server.allocator == allocator) {
			g_server.allocator = nullptr;
		}
		wlr_allocator_destroy(allocator);
	}
	if (renderer) {
		on_renderer_lost.disconnect();
		if (g_server.renderer == renderer) {
			g_server.renderer = nullptr;
		}
		/* the compositor drops its reference on destroy */
		wlr_renderer_destroy(renderer);
	}
}

void
drm_device::handle_change(void *data)
{
	wlr_log(WLR_INFO, "device %s changed", path.c());
	for (auto output : g_server.outputs) {
		if (output->device == this) {
			output_damage_whole(output);
		}
	}
}

static void
mark_removed(struct drm_device *device)
{
	device->removed = true;
	disable_outputs(device);
	device->on_change.disconnect();
	device->on_remove.disconnect();
	g_server.intents.push({INTENT_RELEASE_DEVICE, device->dev});
}

void
drm_device::handle_remove(void *)
{
	wlr_log(WLR_INFO, "device %s removed", path.c());
	mark_removed(this);

	/* secondary backends are children of the primary one */
	if (primary) {
		for (auto device : g_server.devices) {
			if (device != this && !device->removed) {
				wlr_log(WLR_INFO, "removing secondary device %s",
					device->path.c());
				mark_removed(device);
			}
		}
	}
}

void
drm_device::handle_new_output(void *data)
{
	auto wlr_output = (struct wlr_output *)data;
	if (removed) {
		return;
	}
	wlr_log(WLR_INFO, "%s: connector %s connected", path.c(),
		wlr_output->name);
	output_create(wlr_output, this);
}

void
drm_device::handle_backend_destroy(void *)
{
	on_backend_destroy.disconnect();
	on_new_output.disconnect();
	backend = nullptr;
	/* the backend closed the device file */
	on_change.disconnect();
	on_remove.disconnect();
	wlr_device = nullptr;
}

void
drm_device::handle_renderer_lost(void *)
{
	wlr_log(WLR_ERROR, "GPU context of %s lost, re-adding the device",
		path.c());
	g_server.intents.push({INTENT_READD_DEVICE, dev});
}

static void
readd_device(struct drm_device *device)
{
	std::vector<swc_str> paths;
	paths.push_back(device->path);

	if (device->primary) {
		/*
		 * Secondary DRM backends are created with the primary as
		 * parent and render through its renderer (multi-GPU copy),
		 * so wlroots cannot keep them across a new primary renderer.
		 * Losing the primary renderer therefore recreates every
		 * device, and their outputs reconnect.
		 */
		std::vector<drm_device *> secondaries;
		for (auto other : g_server.devices) {
			if (other != device) {
				secondaries.push_back(other);
			}
		}
		for (auto other : secondaries) {
			if (!other->removed) {
				paths.push_back(other->path);
			}
			delete other;
		}
	}
	delete device;

	for (auto &path : paths) {
		if (!device_add(path.c())) {
			wlr_log(WLR_ERROR, "unable to re-add %s", path.c());
		}
	}
}

void
devices_handle_intent(const intent &intent, void *data)
{
	struct drm_device *device = device_from_dev(intent.device);
	if (!device) {
		wlr_log(WLR_DEBUG, "%s: device %u:%u is gone",
			intent_type_name(intent.type), major(intent.device),
			minor(intent.device));
		return;
	}

	switch (intent.type) {
	case INTENT_RELEASE_DEVICE:
		wlr_log(WLR_INFO, "releasing device %s", device->path.c());
		delete device;
		break;
	case INTENT_READD_DEVICE:
		if (device->removed) {
			/* a pending release takes care of it */
			break;
		}
		readd_device(device);
		break;
	}
}

void
devices_handle_session_active(bool active)
{
	if (!active) {
		wlr_log(WLR_INFO, "session paused");
		hotplug_session_paused(live_outputs());
		return;
	}

	wlr_log(WLR_INFO, "session resumed");
	hotplug_session_resumed(live_outputs());
}

static void
handle_add_drm_card(struct wl_listener *listener, void *data)
{
	auto event = (struct wlr_session_add_event *)data;
	wlr_log(WLR_INFO, "GPU %s appeared", event->path);
	if (!device_primary()) {
		wlr_log(WLR_INFO, "%s becomes the primary GPU", event->path);
	}
	device_add(event->path);
}

void
devices_init(void)
{
	struct wlr_device *gpus[MAX_GPUS];
	ssize_t count = wlr_session_find_gpus(g_server.session, MAX_GPUS, gpus);
	if (count < 0) {
		wlr_log(WLR_ERROR, "unable to enumerate GPUs");
		exit(EXIT_FAILURE);
	}

	/* wlr_session_find_gpus() opens the devices, primary first */
	for (ssize_t i = 0; i < count; i++) {
		char *path = drmGetDeviceNameFromFd2(gpus[i]->fd);
		if (!path) {
			wlr_log(WLR_ERROR, "unable to find the path of GPU %zd", i);
			wlr_session_close_file(g_server.session, gpus[i]);
			continue;
		}
		device_create(gpus[i], path);
		free(path);
	}

	if (!device_primary()) {
		wlr_log(WLR_ERROR, "no usable GPU found");
		exit(EXIT_FAILURE);
	}

	g_server.add_drm_card.notify = handle_add_drm_card;
	wl_signal_add(&g_server.session->events.add_drm_card,
		&g_server.add_drm_card);
}

void
devices_finish(void)
{
	wl_list_remove(&g_server.add_drm_card.link);

	/* secondaries first */
	while (!g_server.devices.empty()) {
		delete g_server.devices.back();
	}
}
