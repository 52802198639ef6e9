/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_ACTION_H
#define STACKWC_ACTION_H

#include <vector>
#include "common/str.h"

struct toplevel;

enum action_type {
	ACTION_TYPE_INVALID = 0,
	ACTION_TYPE_NONE,
	ACTION_TYPE_CLOSE,
	ACTION_TYPE_KILL,
	ACTION_TYPE_EXECUTE,
	ACTION_TYPE_EXIT,
	ACTION_TYPE_RECONFIGURE,
	ACTION_TYPE_TOGGLE_FULLSCREEN,
	ACTION_TYPE_TOGGLE_FLOATING,
	ACTION_TYPE_FOCUS,
	ACTION_TYPE_MOVE_WINDOW,
	ACTION_TYPE_SEND_TO_DESKTOP,
	ACTION_TYPE_GO_TO_DESKTOP,
	ACTION_TYPE_VT_SWITCH,
};

enum action_arg_type {
	SWC_ACTION_ARG_STR = 0,
	SWC_ACTION_ARG_INT,
};

/* One key="value" argument, already converted */
struct action_arg {
	enum action_arg_type type;
	swc_str key;
	int ival;
	swc_str sval;
};

/* One <action> of a key binding */
struct action {
	action_type type;
	std::vector<action_arg> args;

	/*
	 * Appends an action of the given (case-insensitive) name.
	 * Unknown names append an invalid action; "None" appends nothing
	 * and returns NULL.
	 */
	static action *append_new(std::vector<action> &actions,
		const char *action_name);

	void add_str(const char *key, const char *value);
	void add_int(const char *key, int value);

	action_arg *get_arg(const char *key, action_arg_type type);

	swc_str get_str(const char *key, const char *default_value);
	int get_int(const char *key, int default_value);

	/* @nodename is the dotted name, e.g. "to.action" */
	void add_arg_from_xml_node(const char *nodename, const char *content);

	/* False for unknown actions and missing required arguments */
	bool is_valid();
};

const char *action_name(enum action_type type);

/*
 * Run @actions in order against @activator, or against the active
 * window of the current workspace when @activator is NULL.
 */
void actions_run(struct toplevel *activator, std::vector<action> &actions);

#endif /* STACKWC_ACTION_H */
