// SPDX-License-Identifier: GPL-2.0-only
#ifndef STACKWC_ALG_H
#define STACKWC_ALG_H

#include <algorithm>
#include <new>
#include <utility>

/* Whole-container wrappers for the <algorithm> calls used everywhere */
namespace swc {

template<typename C, typename Pred>
auto find_if(C &c, const Pred &pred) {
	return std::find_if(c.begin(), c.end(), pred);
}

template<typename C, typename V>
bool contains(const C &c, const V &value) {
	return std::find(c.begin(), c.end(), value) != c.end();
}

/* Erases every element equal to @value */
template<typename C, typename V>
void remove(C &c, const V &value) {
	c.erase(std::remove(c.begin(), c.end(), value), c.end());
}

template<typename C, typename Pred>
void remove_if(C &c, const Pred &pred) {
	c.erase(std::remove_if(c.begin(), c.end(), pred), c.end());
}

/* Assignment through destroy + copy-construct, for intrusive types */
template<typename T>
T &reconstruct(T &self, const T &other) {
	if (&self != &other) {
		self.~T();
		new (&self) T(other);
	}
	return self;
}

} // namespace swc

#endif // STACKWC_ALG_H
