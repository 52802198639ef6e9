/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_INTENT_H
#define STACKWC_INTENT_H

#include <sys/types.h>
#include <vector>
#include <wayland-server-core.h>

enum intent_type {
	/* drop a removed device's entry */
	INTENT_RELEASE_DEVICE = 0,
	/* tear a device down and add it again (context lost) */
	INTENT_READD_DEVICE,
};

struct intent {
	enum intent_type type;
	dev_t device;

	bool operator==(const intent &other) const {
		return type == other.type && device == other.device;
	}
};

/*
 * Work that must not run inside the callback that asks for it, e.g.
 * destroying the object whose signal is being emitted. Pushed intents
 * are handled from an idle source, after the pushing callback returns
 * and before the event loop blocks again. Intents pushed while draining
 * get a new idle source, dispatched in that same pass.
 */
struct intent_queue {
	using handler_func = void (*)(const intent &intent, void *data);

	/* @loop may be NULL, drain() is then left to the caller */
	void init(struct wl_event_loop *loop, handler_func handler,
		void *data);
	void finish();

	/* Queue @intent unless an identical one is pending */
	void push(const intent &intent);

	/*
	 * Handle everything queued so far. Intents pushed by the handler
	 * stay queued for the next drain.
	 */
	void drain();

	std::vector<intent> pending;

private:
	static void handle_idle(void *data);

	struct wl_event_loop *m_loop = nullptr;
	struct wl_event_source *m_idle = nullptr;
	handler_func m_handler = nullptr;
	void *m_data = nullptr;
};

const char *intent_type_name(enum intent_type type);

#endif /* STACKWC_INTENT_H */
