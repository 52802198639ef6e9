// SPDX-License-Identifier: GPL-2.0-only
#include "common/string-helpers.h"
#include <ctype.h>
#include <string.h>

bool
str_space_only(const char *s)
{
	if (!s) {
		return true;
	}
	for (; *s; s++) {
		if (!isspace((unsigned char)*s)) {
			return false;
		}
	}
	return true;
}

void
string_truncate_at_pattern(char *buf, const char *pattern)
{
	if (!buf || !pattern || !strlen(pattern)) {
		return;
	}
	char *p = strstr(buf, pattern);
	if (!p) {
		return;
	}
	*p = '\0';
}

bool
str_starts_with(const char *s, const char *needle)
{
	return s && needle && !strncmp(s, needle, strlen(needle));
}
