// SPDX-License-Identifier: GPL-2.0-only
#include "action.h"
#include <assert.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <wlr/util/log.h>
#include "common/edge.h"
#include "common/string-helpers.h"

/* How the single argument of an action is written in rc.xml */
enum arg_syntax {
	ARG_NONE = 0,
	ARG_TEXT,
	ARG_DIRECTION,
	ARG_INDEX, /* 1-based */
};

static const struct action_info {
	const char *name;
	const char *arg;
	enum arg_syntax syntax;
} actions_info[] = {
	/* indexed by enum action_type */
	{ "INVALID", nullptr, ARG_NONE },
	{ "None", nullptr, ARG_NONE },
	{ "Close", nullptr, ARG_NONE },
	{ "Kill", nullptr, ARG_NONE },
	{ "Execute", "command", ARG_TEXT },
	{ "Exit", nullptr, ARG_NONE },
	{ "Reconfigure", nullptr, ARG_NONE },
	{ "ToggleFullscreen", nullptr, ARG_NONE },
	{ "ToggleFloating", nullptr, ARG_NONE },
	{ "Focus", "direction", ARG_DIRECTION },
	{ "MoveWindow", "direction", ARG_DIRECTION },
	{ "SendToDesktop", "to", ARG_INDEX },
	{ "GoToDesktop", "to", ARG_INDEX },
	{ "VTSwitch", "to", ARG_INDEX },
};

#define ACTION_TYPE_COUNT (sizeof(actions_info) / sizeof(actions_info[0]))
static_assert(ACTION_TYPE_COUNT == ACTION_TYPE_VT_SWITCH + 1,
	"actions_info out of sync with enum action_type");

const char *
action_name(enum action_type type)
{
	assert((size_t)type < ACTION_TYPE_COUNT);
	return actions_info[type].name;
}

static action_arg_type
storage_of(enum arg_syntax syntax)
{
	return syntax == ARG_TEXT ? SWC_ACTION_ARG_STR : SWC_ACTION_ARG_INT;
}

void
action::add_str(const char *key, const char *value)
{
	assert(key);
	action_arg arg = {};
	arg.type = SWC_ACTION_ARG_STR;
	arg.key = swc_str(key);
	arg.sval = swc_str(value);
	args.push_back(std::move(arg));
}

void
action::add_int(const char *key, int value)
{
	assert(key);
	action_arg arg = {};
	arg.type = SWC_ACTION_ARG_INT;
	arg.key = swc_str(key);
	arg.ival = value;
	args.push_back(std::move(arg));
}

action_arg *
action::get_arg(const char *key, action_arg_type type)
{
	assert(key);
	for (auto &arg : args) {
		if (arg.type == type && arg.key == key) {
			return &arg;
		}
	}
	return nullptr;
}

swc_str
action::get_str(const char *key, const char *default_value)
{
	action_arg *arg = get_arg(key, SWC_ACTION_ARG_STR);
	return arg ? arg->sval : swc_str(default_value);
}

int
action::get_int(const char *key, int default_value)
{
	action_arg *arg = get_arg(key, SWC_ACTION_ARG_INT);
	return arg ? arg->ival : default_value;
}

/* -1 unless @content is a whole number >= 1 */
static int
parse_index(const char *content)
{
	char *end = NULL;
	long l = strtol(content, &end, 10);
	return (*content && !*end && l >= 1) ? (int)l : -1;
}

void
action::add_arg_from_xml_node(const char *nodename, const char *content)
{
	const action_info &info = actions_info[type];
	swc_str argument(nodename);
	string_truncate_at_pattern(argument.data(), ".action");

	if (!info.arg || strcmp(argument.c(), info.arg)) {
		wlr_log(WLR_ERROR, "Invalid argument for action %s: '%s'",
			info.name, argument.c());
		return;
	}

	int value = -1;
	switch (info.syntax) {
	case ARG_TEXT:
		add_str(info.arg, content);
		return;
	case ARG_DIRECTION: {
		enum swc_edge edge = swc_edge_parse(content);
		value = (edge == SWC_EDGE_NONE) ? -1 : (int)edge;
		break;
	}
	case ARG_INDEX:
		value = parse_index(content);
		break;
	case ARG_NONE:
		break;
	}

	if (value < 0) {
		wlr_log(WLR_ERROR, "Invalid argument for action %s: '%s' (%s)",
			info.name, argument.c(), content);
		return;
	}
	add_int(info.arg, value);
}

action *
action::append_new(std::vector<action> &actions, const char *action_name)
{
	if (!action_name) {
		wlr_log(WLR_ERROR, "action name not specified");
		return nullptr;
	}

	size_t type = ACTION_TYPE_INVALID;
	for (size_t i = ACTION_TYPE_NONE; i < ACTION_TYPE_COUNT; i++) {
		if (!strcasecmp(action_name, actions_info[i].name)) {
			type = i;
			break;
		}
	}
	if (type == ACTION_TYPE_INVALID) {
		wlr_log(WLR_ERROR, "Invalid action: %s", action_name);
	} else if (type == ACTION_TYPE_NONE) {
		return nullptr;
	}

	actions.push_back({.type = (enum action_type)type});
	return &actions.back();
}

bool
action::is_valid()
{
	if (type == ACTION_TYPE_INVALID) {
		return false;
	}
	const action_info &info = actions_info[type];
	if (!info.arg || get_arg(info.arg, storage_of(info.syntax))) {
		return true;
	}
	wlr_log(WLR_ERROR, "Missing required argument for %s: %s",
		info.name, info.arg);
	return false;
}
