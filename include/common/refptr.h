// SPDX-License-Identifier: GPL-2.0-only
#ifndef STACKWC_REFPTR_H
#define STACKWC_REFPTR_H

#include "alg.h"
#include <assert.h>
#include <utility>

/*
 * Intrusive weak pointer. Resets itself to null when the target is
 * destroyed. The target type inherits weak_target<T>, which keeps a
 * singly linked list of every weakptr currently pointing at it.
 */
template<typename T>
class weakptr
{
public:
	using value_type = T;

	weakptr() {}
	weakptr(const weakptr &wp) { reset(wp.m_ptr); }
	explicit weakptr(T *ptr) { reset(ptr); }
	~weakptr() { reset(); }

	weakptr &operator=(const weakptr &wp) {
		return swc::reconstruct(*this, wp);
	}

	weakptr &operator=(T *ptr) {
		reset(ptr);
		return *this;
	}

	T *get() const { return m_ptr; }

	explicit operator bool() const { return (bool)m_ptr; }

	[[nodiscard]] bool check(T *&ptr) const { return (bool)(ptr = m_ptr); }

	bool operator==(const T *ptr) const { return m_ptr == ptr; }
	bool operator!=(const T *ptr) const { return m_ptr != ptr; }

	void reset(T *ptr = nullptr) {
		if (m_ptr) {
			unlink();
		}
		m_ptr = ptr;
		m_next = nullptr;
		if (ptr) {
			m_next = ptr->m_weak_head;
			ptr->m_weak_head = this;
		}
	}

private:
	void unlink() {
		weakptr **link = &m_ptr->m_weak_head;
		while (*link != this) {
			assert(*link);
			link = &(*link)->m_next;
		}
		*link = m_next;
	}

	T *m_ptr = nullptr;
	weakptr *m_next = nullptr;
};

/* Mix-in for the target of a weakptr */
template<typename T>
class weak_target
{
public:
	friend weakptr<T>;

	weak_target() {}
	~weak_target() {
		while (m_weak_head) {
			m_weak_head->reset();
		}
	}

	// weakptrs would be left pointing at the source of a copy/move
	weak_target(const weak_target &) = delete;
	weak_target &operator=(const weak_target &) = delete;

private:
	weakptr<T> *m_weak_head = nullptr;
};

#endif // STACKWC_REFPTR_H
