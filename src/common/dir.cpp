// SPDX-License-Identifier: GPL-2.0-only
/*
 * Find the configuration directories
 */
#include "common/dir.h"
#include <glib.h>
#include <stdio.h>
#include <stdlib.h>
#include "common/buf.h"

struct dir {
	const char *prefix;
	const char *default_prefix;
	const char *path;
};

static const struct dir config_dirs[] = {
	{
		.prefix = "XDG_CONFIG_HOME",
		.default_prefix = "$HOME/.config",
		.path = "stackwc"
	}, {
		.prefix = "XDG_CONFIG_DIRS",
		.default_prefix = "/etc/xdg",
		.path = "stackwc",
	}, {
		.path = NULL,
	}
};

std::vector<swc_str>
paths_config_create(const char *filename)
{
	std::vector<swc_str> paths;
	bool debug = getenv("STACKWC_DEBUG_DIR_CONFIG");

	for (int i = 0; config_dirs[i].path; i++) {
		const struct dir &d = config_dirs[i];

		/*
		 * $XDG_CONFIG_HOME replaces (rather than augments)
		 * $HOME/.config when defined, likewise for the others.
		 */
		const char *env = getenv(d.prefix);
		swc_str prefix = buf_expand_shell_variables(
			env ? env : d.default_prefix);
		if (!prefix) {
			continue;
		}

		/* $XDG_CONFIG_DIRS may hold several colon separated paths */
		gchar **prefixes = g_strsplit(prefix.c(), ":", -1);
		for (gchar **p = prefixes; *p; p++) {
			if (!**p) {
				continue;
			}
			auto path = strdup_printf("%s/%s/%s", *p, d.path,
				filename);
			if (debug) {
				fprintf(stderr, "%s\n", path.c());
			}
			paths.push_back(std::move(path));
		}
		g_strfreev(prefixes);
	}
	return paths;
}
