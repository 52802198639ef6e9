// SPDX-License-Identifier: GPL-2.0-only
#include "config/rcxml.h"
#include <assert.h>
#include <fstream>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <sstream>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <wlr/types/wlr_keyboard.h>
#include <wlr/util/log.h>
#include "common/alg.h"
#include "common/buf.h"
#include "common/dir.h"
#include "common/parse-bool.h"
#include "common/string-helpers.h"
#include "common/xml.h"

#define ARRAY_SIZE(a) (sizeof(a) / sizeof((a)[0]))

struct rcxml rc;

static const float default_active_color[4] = {
	0x8b / 255.0f, 0x40 / 255.0f, 0x00 / 255.0f, 1.0f
};
static const float default_inactive_color[4] = {
	0x2a / 255.0f, 0x2a / 255.0f, 0x2a / 255.0f, 1.0f
};

static struct key_combos {
	const char *binding, *action;
	struct {
		const char *name, *value;
	} attributes[1];
} key_combos[] = { {
		.binding = "W-c",
		.action = "Close",
	}, {
		.binding = "W-S-Return",
		.action = "Exit",
	}, {
		.binding = "W-f",
		.action = "ToggleFullscreen",
	}, {
		.binding = "W-space",
		.action = "ToggleFloating",
	}, {
		.binding = "W-r",
		.action = "Reconfigure",
	}, {
		.binding = "W-q",
		.action = "Execute",
		.attributes = {{ "command", "foot" }},
	}, {
		.binding = "W-1",
		.action = "GoToDesktop",
		.attributes = {{ "to", "1" }},
	}, {
		.binding = "W-2",
		.action = "GoToDesktop",
		.attributes = {{ "to", "2" }},
	}, {
		.binding = "W-3",
		.action = "GoToDesktop",
		.attributes = {{ "to", "3" }},
	}, {
		.binding = "W-4",
		.action = "GoToDesktop",
		.attributes = {{ "to", "4" }},
	}, {
		.binding = "C-A-1",
		.action = "SendToDesktop",
		.attributes = {{ "to", "1" }},
	}, {
		.binding = "C-A-2",
		.action = "SendToDesktop",
		.attributes = {{ "to", "2" }},
	}, {
		.binding = "C-A-3",
		.action = "SendToDesktop",
		.attributes = {{ "to", "3" }},
	}, {
		.binding = "C-A-4",
		.action = "SendToDesktop",
		.attributes = {{ "to", "4" }},
	}, {
		.binding = "W-h",
		.action = "Focus",
		.attributes = {{ "direction", "left" }},
	}, {
		.binding = "W-j",
		.action = "Focus",
		.attributes = {{ "direction", "down" }},
	}, {
		.binding = "W-k",
		.action = "Focus",
		.attributes = {{ "direction", "up" }},
	}, {
		.binding = "W-l",
		.action = "Focus",
		.attributes = {{ "direction", "right" }},
	}, {
		.binding = "C-A-h",
		.action = "MoveWindow",
		.attributes = {{ "direction", "left" }},
	}, {
		.binding = "C-A-j",
		.action = "MoveWindow",
		.attributes = {{ "direction", "down" }},
	}, {
		.binding = "C-A-k",
		.action = "MoveWindow",
		.attributes = {{ "direction", "up" }},
	}, {
		.binding = "C-A-l",
		.action = "MoveWindow",
		.attributes = {{ "direction", "right" }},
	}, {
		.binding = NULL,
	},
};

/* Strict decimal integer */
static bool
parse_int(const char *content, int *value)
{
	char *end = NULL;
	long l = strtol(content, &end, 10);
	if (!*content || *end) {
		return false;
	}
	*value = (int)l;
	return true;
}

static void
set_non_negative(const char *nodename, const char *content, int *variable)
{
	int value;
	if (!parse_int(content, &value) || value < 0) {
		wlr_log(WLR_ERROR, "invalid value for <%s>: '%s'",
			nodename, content);
		return;
	}
	*variable = value;
}

static void
set_color(const char *nodename, const char *content, float *rgba)
{
	if (!hex_color_parse(content, rgba)) {
		wlr_log(WLR_ERROR, "invalid color for <%s>: '%s'",
			nodename, content);
	}
}

static void
parse_action_args(xmlNode *node, action &action)
{
	xmlNode *child;
	const char *key, *content;
	SWC_XML_FOR_EACH(node, child, key, content) {
		if (!strcasecmp(key, "name")) {
			/* Ignore <action name=""> */
			continue;
		}
		char buffer[256];
		char *node_name = nodename(child, buffer, sizeof(buffer));
		action.add_arg_from_xml_node(node_name, content);
	}
}

static void
append_parsed_actions(xmlNode *node, std::vector<action> &actions)
{
	xmlNode *child;
	SWC_XML_FOR_EACH_ELEMENT(node, child) {
		if (!swc_xml_node_is(child, "action")) {
			continue;
		}
		swc_str name;
		if (!swc_xml_get_string(child, "name", name)) {
			wlr_log(WLR_ERROR, "action name not specified");
			continue;
		}
		auto action = action::append_new(actions, name.c());
		if (action) {
			parse_action_args(child, *action);
		}
	}
}

static void
fill_keybind(xmlNode *node)
{
	swc_str keyname;
	if (!swc_xml_get_string(node, "key", keyname)) {
		wlr_log(WLR_ERROR, "keybind without key");
		return;
	}
	auto keybind = keybind_append_new(rc.keybinds, keyname.c());
	if (!keybind) {
		wlr_log(WLR_ERROR, "Invalid keybind: %s", keyname.c());
		return;
	}
	append_parsed_actions(node, keybind->actions);
}

static void
fill_output(xmlNode *node)
{
	output_config config;
	if (!swc_xml_get_string(node, "name", config.name) || !config.name) {
		wlr_log(WLR_ERROR, "<output> without name ignored");
		return;
	}

	swc_xml_get_bool(node, "enabled", &config.enabled);
	swc_xml_get_int(node, "width", &config.width);
	swc_xml_get_int(node, "height", &config.height);
	swc_xml_get_int(node, "refresh", &config.refresh);
	if (config.width < 0 || config.height < 0
			|| (config.width > 0) != (config.height > 0)) {
		wlr_log(WLR_ERROR, "invalid resolution for output %s",
			config.name.c());
		config.width = 0;
		config.height = 0;
	}
	if (config.refresh < 0) {
		wlr_log(WLR_ERROR, "invalid refresh rate for output %s",
			config.name.c());
		config.refresh = 0;
	}

	float scale = 0;
	if (swc_xml_get_float(node, "scale", &scale)) {
		if (scale > 0) {
			config.scale = scale;
		} else {
			wlr_log(WLR_ERROR, "invalid scale for output %s",
				config.name.c());
		}
	}

	bool has_x = swc_xml_get_int(node, "x", &config.x);
	bool has_y = swc_xml_get_int(node, "y", &config.y);
	config.has_position = has_x && has_y;

	/* A later entry for the same connector replaces the earlier one */
	swc::remove_if(rc.outputs, [&](auto &o) { return o.name == config.name; });
	rc.outputs.push_back(std::move(config));
}

static void
fill_outputs(xmlNode *node)
{
	xmlNode *child;
	SWC_XML_FOR_EACH_ELEMENT(node, child) {
		if (swc_xml_node_is(child, "output")) {
			fill_output(child);
		}
	}
}

static void load_default_key_bindings(void);

/* Returns true if the children of @node should be walked as well */
static bool
entry(xmlNode *node, char *nodename, const char *content)
{
	string_truncate_at_pattern(nodename, ".stackwc_config");

	if (getenv("STACKWC_DEBUG_CONFIG_NODENAMES")) {
		printf("%s: %s\n", nodename, content);
	}

	/* handle nested nodes */
	if (!strcasecmp(nodename, "keybind.keyboard")) {
		fill_keybind(node);
	} else if (!strcasecmp(nodename, "outputs")) {
		fill_outputs(node);

	/* handle nodes without content, e.g. <keyboard><default /> */
	} else if (!strcasecmp(nodename, "default.keyboard")) {
		load_default_key_bindings();

	} else if (!swc_xml_node_is_leaf(node)) {
		/* parse children of nested nodes other than above */
		return true;

	} else if (str_space_only(content)) {
		/* ignore empty leaf nodes other than above */

	/* handle non-empty leaf nodes */
	} else if (!strcasecmp(nodename, "number.desktops")) {
		int count;
		if (!parse_int(content, &count) || count < WORKSPACES_MIN
				|| count > WORKSPACES_MAX) {
			wlr_log(WLR_ERROR, "invalid number of desktops '%s'"
				" (must be %d..%d)", content,
				WORKSPACES_MIN, WORKSPACES_MAX);
		} else {
			rc.workspace_count = count;
		}
	} else if (!strcasecmp(nodename, "thickness.border")) {
		set_non_negative(nodename, content, &rc.border_thickness);
	} else if (!strcasecmp(nodename, "gap.border")) {
		set_non_negative(nodename, content, &rc.gap);
	} else if (!strcasecmp(nodename, "activeColor.border")) {
		set_color(nodename, content, rc.active_border_color);
	} else if (!strcasecmp(nodename, "inactiveColor.border")) {
		set_color(nodename, content, rc.inactive_border_color);
	} else if (!strcasecmp(nodename, "layout.keyboard")) {
		rc.kb_layout = swc_str(content);
	} else if (!strcasecmp(nodename, "repeatRate.keyboard")) {
		set_non_negative(nodename, content, &rc.repeat_rate);
	} else if (!strcasecmp(nodename, "repeatDelay.keyboard")) {
		set_non_negative(nodename, content, &rc.repeat_delay);
	} else if (!strcasecmp(nodename, "modifier.mouse")) {
		uint32_t modifier = parse_modifier(content);
		if (modifier) {
			rc.mouse_modifier = modifier;
		} else {
			wlr_log(WLR_ERROR, "invalid mouse modifier '%s'",
				content);
		}
	} else if (!strcasecmp(nodename, "command.autostart")) {
		rc.autostart.push_back(swc_str(content));
	} else {
		wlr_log(WLR_INFO, "unknown config node <%s>", nodename);
	}

	return false;
}

static void
traverse(xmlNode *node)
{
	xmlNode *child;
	SWC_XML_FOR_EACH_ELEMENT(node, child) {
		char buffer[256];
		char *name = nodename(child, buffer, sizeof(buffer));
		if (name && entry(child, name, swc_xml_leaf_content(child))) {
			traverse(child);
		}
	}
}

static void
rcxml_parse_xml(const std::string &buf)
{
	int options = XML_PARSE_NONET | XML_PARSE_NOBLANKS;
	xmlDoc *d = xmlReadMemory(buf.data(), buf.size(), NULL, NULL, options);
	if (!d) {
		wlr_log(WLR_ERROR, "error parsing config file");
		return;
	}
	xmlNode *root = xmlDocGetRootElement(d);
	if (root) {
		swc_xml_expand_attributes(root);
		traverse(root);
	}

	xmlFreeDoc(d);
	xmlCleanupParser();
}

static void
rcxml_init(void)
{
	rc = rcxml();

	rc.workspace_count = 4;

	rc.border_thickness = 2;
	rc.gap = 2;
	memcpy(rc.active_border_color, default_active_color,
		sizeof(rc.active_border_color));
	memcpy(rc.inactive_border_color, default_inactive_color,
		sizeof(rc.inactive_border_color));

	rc.repeat_rate = 25;
	rc.repeat_delay = 600;

	rc.mouse_modifier = WLR_MODIFIER_LOGO;
}

static void
load_default_key_bindings(void)
{
	for (int i = 0; key_combos[i].binding; i++) {
		struct key_combos *current = &key_combos[i];
		auto k = keybind_append_new(rc.keybinds, current->binding);
		assert(k);
		auto action = action::append_new(k->actions, current->action);
		assert(action);

		for (size_t j = 0; j < ARRAY_SIZE(current->attributes); j++) {
			if (!current->attributes[j].name
					|| !current->attributes[j].value) {
				break;
			}
			action->add_arg_from_xml_node(
				current->attributes[j].name,
				current->attributes[j].value);
		}
	}

	/* C-A-F1..F12 switch virtual terminals */
	for (int vt = 1; vt <= 12; vt++) {
		auto combo = strdup_printf("C-A-F%d", vt);
		auto k = keybind_append_new(rc.keybinds, combo.c());
		assert(k);
		auto action = action::append_new(k->actions, "VTSwitch");
		assert(action);
		action->add_int("to", vt);
	}
}

/*
 * Replace all earlier bindings by later ones and clear the ones with
 * an empty action list, so that a default binding can be removed with
 * the "None" action.
 */
static void
deduplicate_key_bindings(void)
{
	size_t replaced = 0;
	size_t cleared = 0;
	for (size_t i = 0; i < rc.keybinds.size(); i++) {
		for (size_t j = i + 1; j < rc.keybinds.size(); j++) {
			if (keybind_the_same(rc.keybinds[i], rc.keybinds[j])) {
				rc.keybinds[i].actions.clear();
				replaced++;
				break;
			}
		}
	}
	swc::remove_if(rc.keybinds, [&](auto &k) {
		if (k.actions.empty()) {
			cleared++;
			return true;
		}
		return false;
	});
	if (replaced) {
		wlr_log(WLR_DEBUG, "Replaced %zu keybinds", replaced);
	}
	if (cleared -= replaced) {
		wlr_log(WLR_DEBUG, "Cleared %zu keybinds", cleared);
	}
}

static void
post_processing(void)
{
	if (rc.keybinds.empty()) {
		wlr_log(WLR_INFO, "load default key bindings");
		load_default_key_bindings();
	}
	deduplicate_key_bindings();
}

static void
validate_actions(void)
{
	for (auto &keybind : rc.keybinds) {
		swc::remove_if(keybind.actions, [](auto &action) {
			if (action.is_valid()) {
				return false;
			}
			wlr_log(WLR_ERROR, "Removed invalid keybind action");
			return true;
		});
	}
	swc::remove_if(rc.keybinds, [](auto &k) { return k.actions.empty(); });
}

static void
validate(void)
{
	validate_actions();
}

void
rcxml_parse_string(const char *xml)
{
	rcxml_init();
	if (xml) {
		rcxml_parse_xml(std::string(xml));
	}
	post_processing();
	validate();
}

void
rcxml_read(const char *filename)
{
	rcxml_init();

	std::vector<swc_str> paths;
	if (filename) {
		/* Honour command line argument -c <filename> */
		paths.push_back(swc_str(filename));
		rc.config_file = swc_str(filename);
	} else {
		paths = paths_config_create("rc.xml");
	}

	/* Reading file into buffer before parsing - better for unit tests */
	for (auto &path : paths) {
		std::ifstream ifs(path);
		if (!ifs.good()) {
			continue;
		}

		wlr_log(WLR_INFO, "read config file %s", path.c());

		std::ostringstream oss;
		oss << ifs.rdbuf();
		rcxml_parse_xml(oss.str());
		break;
	}
	post_processing();
	validate();
}

void
rcxml_finish(void)
{
	rc = rcxml();
}

const struct output_config *
rcxml_output_config(const char *name)
{
	if (!name) {
		return NULL;
	}
	auto it = swc::find_if(rc.outputs,
		[&](auto &config) { return config.name == name; });
	return it != rc.outputs.end() ? &*it : NULL;
}
