/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_LISTENER_H
#define STACKWC_LISTENER_H

#include <wayland-server-core.h>

/*
 * Calls a member function of @T when a wl_signal fires. The link is
 * removed when the listener goes away, so a handler never outlives
 * its owner.
 */
template<typename T>
class listener
{
public:
	using func = void (T::*)(void *);

	listener(T *owner, func handler) : m_owner(owner), m_handler(handler) {}
	~listener() { disconnect(); }

	listener(const listener &) = delete;
	listener &operator=(const listener &) = delete;

	/* Moves the listener if it was already on another signal */
	void connect(wl_signal *signal) {
		disconnect();
		m_wl.notify = dispatch;
		wl_signal_add(signal, &m_wl);
	}

	void disconnect() {
		if (!m_wl.notify) {
			return;
		}
		wl_list_remove(&m_wl.link);
		m_wl = wl_listener{};
	}

private:
	static void dispatch(struct wl_listener *wl, void *data) {
		/* m_wl is the first member */
		auto self = reinterpret_cast<listener *>(wl);
		(self->m_owner->*self->m_handler)(data);
	}

	wl_listener m_wl{};
	T *const m_owner;
	func const m_handler;
};

#define DECLARE_LISTENER(type, name) \
	listener<type> on_##name{this, &type::handle_##name}

#define DECLARE_HANDLER(type, name) \
	void handle_##name(void * = nullptr); \
	DECLARE_LISTENER(type, name)

#define CONNECT_LISTENER(src, dest, name) \
	(dest)->on_##name.connect(&(src)->events.name)

/* Deleted when the signal connected to on_destroy fires */
class destroyable
{
public:
	destroyable() = default;
	virtual ~destroyable() = default;

	destroyable(const destroyable &) = delete;
	destroyable &operator=(const destroyable &) = delete;

	DECLARE_LISTENER(destroyable, destroy);

private:
	void handle_destroy(void *) { delete this; }
};

#endif /* STACKWC_LISTENER_H */
