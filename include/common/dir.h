/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_DIR_H
#define STACKWC_DIR_H

#include <vector>
#include "common/str.h"

/*
 * Candidate locations of a config file, most important first:
 * $XDG_CONFIG_HOME/stackwc/<filename> followed by each entry of
 * $XDG_CONFIG_DIRS. The files are not checked for existence.
 */
std::vector<swc_str> paths_config_create(const char *filename);

#endif /* STACKWC_DIR_H */
