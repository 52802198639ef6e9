// SPDX-License-Identifier: GPL-2.0-only
#include "buffer.h"
#include <assert.h>
#include <math.h>
#include <drm_fourcc.h>
#include <wlr/interfaces/wlr_buffer.h>
#include <wlr/render/wlr_texture.h>
#include <wlr/util/log.h>

static cairo_buffer *
to_cairo_buffer(struct wlr_buffer *buffer)
{
	assert(buffer->impl == &cairo_buffer::impl);
	return static_cast<cairo_buffer *>(buffer);
}

static void
handle_buffer_destroy(struct wlr_buffer *buffer)
{
	delete to_cairo_buffer(buffer);
}

/* The image stays mapped for the lifetime of the buffer */
static bool
handle_begin_access(struct wlr_buffer *buffer, uint32_t flags, void **data,
		uint32_t *format, size_t *stride)
{
	cairo_surface_t *image = to_cairo_buffer(buffer)->image;
	cairo_surface_flush(image);
	*data = cairo_image_surface_get_data(image);
	*format = DRM_FORMAT_ARGB8888;
	*stride = cairo_image_surface_get_stride(image);
	return true;
}

static void
handle_end_access(struct wlr_buffer *buffer)
{
	cairo_surface_mark_dirty(to_cairo_buffer(buffer)->image);
}

const wlr_buffer_impl cairo_buffer::impl = {
	.destroy = handle_buffer_destroy,
	.begin_data_ptr_access = handle_begin_access,
	.end_data_ptr_access = handle_end_access,
};

cairo_buffer::cairo_buffer(cairo_surface_t *image)
	: wlr_buffer{}, image(image), cairo(cairo_create(image))
{
	wlr_buffer_init(this, &impl, cairo_image_surface_get_width(image),
		cairo_image_surface_get_height(image));
}

cairo_buffer::~cairo_buffer()
{
	cairo_destroy(cairo);
	cairo_surface_destroy(image);
	wlr_buffer_finish(this);
}

cairo_buffer *
cairo_buffer_create(int logical_width, int logical_height, float scale)
{
	cairo_surface_t *image = cairo_image_surface_create(CAIRO_FORMAT_ARGB32,
		(int)lroundf(logical_width * scale),
		(int)lroundf(logical_height * scale));
	if (cairo_surface_status(image) != CAIRO_STATUS_SUCCESS) {
		wlr_log(WLR_ERROR, "unable to allocate %dx%d image",
			logical_width, logical_height);
		cairo_surface_destroy(image);
		return nullptr;
	}
	cairo_surface_set_device_scale(image, scale, scale);
	return new cairo_buffer(image);
}

struct wlr_texture *
cairo_buffer_finish(cairo_buffer *buffer, struct wlr_renderer *renderer)
{
	struct wlr_texture *texture = wlr_texture_from_buffer(renderer, buffer);
	/* the texture holds its own copy */
	wlr_buffer_drop(buffer);
	return texture;
}
