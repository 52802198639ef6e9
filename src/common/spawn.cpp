// SPDX-License-Identifier: GPL-2.0-only
#include "common/spawn.h"
#include <glib.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>
#include <wlr/util/log.h>

static void
reset_signals_and_limits(void)
{
	sigset_t set;
	sigemptyset(&set);
	sigprocmask(SIG_SETMASK, &set, NULL);
	signal(SIGCHLD, SIG_DFL);
	signal(SIGPIPE, SIG_DFL);
}

/* Run @argv in a grandchild. @argv[0] is looked up in $PATH. */
static void
spawn_argv(char **argv)
{
	pid_t child = fork();
	switch (child) {
	case -1:
		wlr_log_errno(WLR_ERROR, "unable to fork()");
		return;
	case 0:
		setsid();
		reset_signals_and_limits();
		switch (fork()) {
		case -1:
			_exit(EXIT_FAILURE);
		case 0:
			execvp(argv[0], argv);
			_exit(EXIT_FAILURE);
		default:
			_exit(EXIT_SUCCESS);
		}
	default:
		break;
	}
	waitpid(child, NULL, 0);
}

void
spawn_async_no_shell(const char *command)
{
	GError *err = NULL;
	gchar **argv = NULL;

	if (!command || !*command) {
		return;
	}

	g_shell_parse_argv((gchar *)command, NULL, &argv, &err);
	if (err) {
		wlr_log(WLR_ERROR, "cannot parse '%s': %s", command,
			err->message);
		g_error_free(err);
		return;
	}
	spawn_argv(argv);
	g_strfreev(argv);
}

void
spawn_shell(const char *command)
{
	if (!command || !*command) {
		return;
	}
	char *argv[] = {
		(char *)"/bin/sh",
		(char *)"-c",
		(char *)command,
		NULL
	};
	spawn_argv(argv);
}
