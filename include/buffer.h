/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_BUFFER_H
#define STACKWC_BUFFER_H

#include <cairo.h>
#include <wlr/types/wlr_buffer.h>

struct wlr_renderer;
struct wlr_texture;

/*
 * Scratch image for compositor-drawn pixels (the fallback cursor).
 * Drawing goes through @cairo in logical coordinates; the pixel size
 * of the buffer is the logical size times the scale it was made for.
 */
struct cairo_buffer : public wlr_buffer {
	static const wlr_buffer_impl impl;

	cairo_surface_t *image = nullptr;
	cairo_t *cairo = nullptr;

	cairo_buffer(cairo_surface_t *image);
	~cairo_buffer();
};

/* Returns NULL if cairo could not allocate the image */
cairo_buffer *cairo_buffer_create(int logical_width, int logical_height,
	float scale);

/*
 * Upload the pixels drawn so far and drop the buffer. The texture (or
 * NULL on failure) belongs to the caller.
 */
struct wlr_texture *cairo_buffer_finish(cairo_buffer *buffer,
	struct wlr_renderer *renderer);

#endif /* STACKWC_BUFFER_H */
