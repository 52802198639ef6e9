/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_SPAWN_H
#define STACKWC_SPAWN_H

/**
 * spawn_async_no_shell - execute asynchronously
 * @command: command to be executed
 *
 * The command is split into arguments with shell quoting rules but is
 * not run by a shell. The child is double-forked so that it never
 * becomes a zombie of the compositor.
 */
void spawn_async_no_shell(const char *command);

/**
 * spawn_shell - run @command with /bin/sh -c, detached
 * @command: command line
 */
void spawn_shell(const char *command);

#endif /* STACKWC_SPAWN_H */
