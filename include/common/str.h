// SPDX-License-Identifier: GPL-2.0-only
#ifndef STACKWC_STR_H
#define STACKWC_STR_H

#include <string>

/*
 * std::string that is built explicitly from (const char *), treats a
 * null source as empty, and spells c_str() as c().
 *
 * operator bool() tests for non-empty.
 */
class swc_str : public std::string
{
public:
	swc_str() {}
	swc_str(const swc_str &s) : std::string(s) {}
	swc_str(swc_str &&s) : std::string(std::move(s)) {}
	explicit swc_str(const char *s) : std::string(s ? s : "") {}
	explicit swc_str(const std::string &s) : std::string(s) {}

	swc_str &operator=(const swc_str &s) {
		std::string::operator=(s);
		return *this;
	}

	swc_str &operator=(swc_str &&s) {
		std::string::operator=(std::move(s));
		return *this;
	}

	const char *c() const { return std::string::c_str(); }
	const char *c_str() = delete; // use c() instead

	explicit operator bool() const { return !empty(); }

	bool operator==(const swc_str &s) const {
		return static_cast<const std::string &>(*this)
			== static_cast<const std::string &>(s);
	}

	bool operator!=(const swc_str &s) const { return !operator==(s); }

	bool operator==(const char *s) const {
		return static_cast<const std::string &>(*this) == (s ? s : "");
	}

	bool operator!=(const char *s) const { return !operator==(s); }

	bool operator==(std::nullptr_t) const = delete;
	bool operator!=(std::nullptr_t) const = delete;
};

/* printf() into a new string */
swc_str strdup_printf(const char *fmt, ...)
	__attribute__((format(printf, 1, 2)));

#endif // STACKWC_STR_H
