// SPDX-License-Identifier: GPL-2.0-only
#include "common/buf.h"
#include <ctype.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

swc_str
strdup_printf(const char *fmt, ...)
{
	va_list ap;
	va_start(ap, fmt);
	int size = vsnprintf(NULL, 0, fmt, ap);
	va_end(ap);
	if (size < 0) {
		return swc_str();
	}

	swc_str s;
	s.resize(size + 1);
	va_start(ap, fmt);
	vsnprintf(s.data(), size + 1, fmt, ap);
	va_end(ap);
	s.resize(size);
	return s;
}

swc_str
buf_expand_tilde(const char *s)
{
	swc_str tmp;
	for (; *s; s++) {
		if (*s == '~') {
			auto home = getenv("HOME");
			tmp += home ? home : "";
		} else {
			tmp += *s;
		}
	}
	return tmp;
}

static bool
is_var_char(char p)
{
	return isalnum((unsigned char)p) || p == '_';
}

swc_str
buf_expand_shell_variables(const char *s)
{
	swc_str tmp;
	while (*s) {
		if (*s != '$') {
			tmp += *s++;
			continue;
		}

		bool braced = s[1] == '{';
		const char *start = s + (braced ? 2 : 1);
		const char *end = start;
		while (is_var_char(*end)) {
			end++;
		}
		if (end == start || (braced && *end != '}')) {
			/* not a variable reference, copy verbatim */
			tmp += *s++;
			continue;
		}

		std::string name(start, end - start);
		const char *value = getenv(name.c_str());
		if (value) {
			tmp += value;
		}
		s = braced ? end + 1 : end;
	}
	return tmp;
}

static int
hex_digit(char c)
{
	if (c >= '0' && c <= '9') {
		return c - '0';
	} else if (c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	} else if (c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	}
	return -1;
}

bool
hex_color_parse(const char *s, float rgba[4])
{
	if (!s || s[0] != '#') {
		return false;
	}
	size_t len = strlen(s + 1);
	if (len != 6 && len != 8) {
		return false;
	}

	float channels[4] = { 0, 0, 0, 1.0f };
	for (size_t i = 0; i < len / 2; i++) {
		int hi = hex_digit(s[1 + 2 * i]);
		int lo = hex_digit(s[2 + 2 * i]);
		if (hi < 0 || lo < 0) {
			return false;
		}
		channels[i] = (hi * 16 + lo) / 255.0f;
	}

	/* wlroots expects pre-multiplied colors */
	rgba[0] = channels[0] * channels[3];
	rgba[1] = channels[1] * channels[3];
	rgba[2] = channels[2] * channels[3];
	rgba[3] = channels[3];
	return true;
}
