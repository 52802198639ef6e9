/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_RCXML_H
#define STACKWC_RCXML_H

#include <stdint.h>
#include <vector>
#include "common/str.h"
#include "config/keybind.h"

#define WORKSPACES_MIN 1
#define WORKSPACES_MAX 32

/* <output name="" enabled="" width="" height="" refresh="" scale="" x="" y=""/> */
struct output_config {
	swc_str name;
	bool enabled = true;
	/* 0 means "use the preferred mode" */
	int width = 0;
	int height = 0;
	int refresh = 0; /* Hz */
	/* 0 means unset */
	float scale = 0;
	bool has_position = false;
	int x = 0;
	int y = 0;
};

struct rcxml {
	/* from command line */
	swc_str config_file;

	/* desktops */
	int workspace_count;

	/* border */
	int border_thickness;
	int gap;
	float active_border_color[4];
	float inactive_border_color[4];

	/* keyboard */
	swc_str kb_layout; /* empty: take XKB_DEFAULT_LAYOUT */
	int repeat_rate;
	int repeat_delay;
	std::vector<keybind> keybinds;

	/* mouse */
	uint32_t mouse_modifier;

	std::vector<output_config> outputs;
	std::vector<swc_str> autostart;
};

extern struct rcxml rc;

/*
 * Reset rc to the defaults and load the configuration from @filename,
 * or from the first rc.xml found in the XDG config directories when
 * @filename is NULL.
 */
void rcxml_read(const char *filename);

/* Same as rcxml_read() with the file contents given directly */
void rcxml_parse_string(const char *xml);

void rcxml_finish(void);

/* Configuration of the output named @name, or NULL */
const struct output_config *rcxml_output_config(const char *name);

#endif /* STACKWC_RCXML_H */
