// SPDX-License-Identifier: GPL-2.0-only
#include <signal.h>
#include <unistd.h>
#include <wlr/backend/session.h>
#include <wlr/util/log.h>
#include "action.h"
#include "common/buf.h"
#include "common/spawn.h"
#include "input/cursor.h"
#include "stackwc.h"
#include "window.h"

static void
run_action(struct toplevel *client, action &action)
{
	struct workspace_manager &workspaces = g_server.workspaces;

	switch (action.type) {
	case ACTION_TYPE_NONE:
		break;
	case ACTION_TYPE_CLOSE:
		if (client) {
			client->close();
		}
		break;
	case ACTION_TYPE_KILL:
		if (client) {
			/* Send SIGTERM to the process associated with the surface */
			pid_t pid = client->get_pid();
			if (pid == getpid()) {
				wlr_log(WLR_ERROR, "Preventing sending SIGTERM to stackwc");
			} else if (pid > 0) {
				kill(pid, SIGTERM);
			}
		}
		break;
	case ACTION_TYPE_EXECUTE: {
		swc_str cmd = action.get_str("command", NULL);
		cmd = buf_expand_tilde(cmd.c());
		spawn_async_no_shell(cmd.c());
		break;
	}
	case ACTION_TYPE_EXIT:
		wl_display_terminate(g_server.wl_display);
		break;
	case ACTION_TYPE_RECONFIGURE:
		kill(getpid(), SIGHUP);
		break;
	case ACTION_TYPE_TOGGLE_FULLSCREEN:
		if (client) {
			window *win = workspaces.find_window(client);
			bool fullscreen = win && win->mode == WINDOW_MODE_FULLSCREEN;
			workspaces.set_fullscreen(client, !fullscreen);
		}
		break;
	case ACTION_TYPE_TOGGLE_FLOATING:
		if (client) {
			workspaces.toggle_floating(client);
		}
		break;
	case ACTION_TYPE_FOCUS:
	case ACTION_TYPE_MOVE_WINDOW: {
		/* Config parsing makes sure that direction is a valid direction */
		auto direction = (enum swc_edge)action.get_int("direction", 0);
		struct wlr_point pointer;
		bool moved = action.type == ACTION_TYPE_FOCUS
			? workspaces.change_focus(direction, &pointer)
			: workspaces.move_window(direction, &pointer);
		/* the active window is re-derived from the pointer */
		if (moved) {
			cursor_warp(pointer.x, pointer.y);
		}
		break;
	}
	case ACTION_TYPE_GO_TO_DESKTOP:
		if (workspaces.set_active_workspace(action.get_int("to", 1) - 1)) {
			cursor_update_focus();
		}
		break;
	case ACTION_TYPE_SEND_TO_DESKTOP:
		if (workspaces.move_window_to_workspace(action.get_int("to", 1) - 1)) {
			cursor_update_focus();
		}
		break;
	case ACTION_TYPE_VT_SWITCH:
		if (g_server.session) {
			wlr_session_change_vt(g_server.session,
				action.get_int("to", 1));
		}
		break;
	default:
		/* an action type without a case above */
		wlr_log(WLR_ERROR,
			"Not executing invalid action (%u)"
			" This is a BUG. Please report.", action.type);
	}
}

void
actions_run(struct toplevel *activator, std::vector<action> &actions)
{
	if (actions.empty()) {
		wlr_log(WLR_ERROR, "empty actions");
		return;
	}

	for (auto &action : actions) {
		wlr_log(WLR_DEBUG, "Handling action %u: %s", action.type,
			action_name(action.type));

		/*
		 * Refetch the window because it may have been changed by
		 * the previous action
		 */
		struct toplevel *client = activator;
		if (!client) {
			client = g_server.workspaces.current().active.get();
		}
		run_action(client, action);
	}
}
