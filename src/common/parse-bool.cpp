// SPDX-License-Identifier: GPL-2.0-only
#include "common/parse-bool.h"
#include <string.h>
#include <strings.h>
#include <wlr/util/log.h>

int
parse_bool(const char *str, int default_value)
{
	if (!str) {
		goto error_not_a_boolean;
	} else if (!strcasecmp(str, "yes")) {
		return 1;
	} else if (!strcasecmp(str, "true")) {
		return 1;
	} else if (!strcasecmp(str, "on")) {
		return 1;
	} else if (!strcmp(str, "1")) {
		return 1;
	} else if (!strcasecmp(str, "no")) {
		return 0;
	} else if (!strcasecmp(str, "false")) {
		return 0;
	} else if (!strcasecmp(str, "off")) {
		return 0;
	} else if (!strcmp(str, "0")) {
		return 0;
	}
error_not_a_boolean:
	wlr_log(WLR_ERROR, "(%s) is not a boolean value", str ? str : "(null)");
	return default_value;
}

void
set_bool(const char *str, bool *variable)
{
	int ret = parse_bool(str, -1);
	if (ret < 0) {
		return;
	}
	*variable = ret;
}
