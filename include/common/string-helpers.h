/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_STRING_HELPERS_H
#define STACKWC_STRING_HELPERS_H

/**
 * str_space_only - Check if the string only contains white-space characters
 * @s: string to check
 */
bool str_space_only(const char *s);

/**
 * string_truncate_at_pattern - remove pattern and everything after it
 * @buf: pointer to buffer
 * @pattern: string to remove
 */
void string_truncate_at_pattern(char *buf, const char *pattern);

/**
 * str_starts_with - check if string starts with a given prefix
 * @s: string to check
 * @needle: prefix
 */
bool str_starts_with(const char *s, const char *needle);

#endif /* STACKWC_STRING_HELPERS_H */
