/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_BUF_H
#define STACKWC_BUF_H

#include <stdbool.h>
#include "common/str.h"

/**
 * buf_expand_tilde - expand ~ to $HOME
 * @s: input string
 */
swc_str buf_expand_tilde(const char *s);

/**
 * buf_expand_shell_variables - expand $foo and ${foo}
 * @s: input string
 * Note: $$ is not handled
 */
swc_str buf_expand_shell_variables(const char *s);

/**
 * hex_color_parse - parse "#rrggbb" or "#rrggbbaa"
 * @s: color string
 * @rgba: receives the color, pre-multiplied by alpha
 *
 * Returns false (leaving @rgba untouched) if @s is malformed.
 */
bool hex_color_parse(const char *s, float rgba[4]);

#endif /* STACKWC_BUF_H */
