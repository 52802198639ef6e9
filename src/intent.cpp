// SPDX-License-Identifier: GPL-2.0-only
#include "intent.h"
#include <assert.h>
#include <sys/sysmacros.h>
#include <wlr/util/log.h>
#include "common/alg.h"

const char *
intent_type_name(enum intent_type type)
{
	switch (type) {
	case INTENT_RELEASE_DEVICE:
		return "release_device";
	case INTENT_READD_DEVICE:
		return "readd_device";
	}
	return "unknown";
}

void
intent_queue::init(struct wl_event_loop *loop, handler_func handler,
		void *data)
{
	assert(handler);
	m_loop = loop;
	m_handler = handler;
	m_data = data;
}

void
intent_queue::finish()
{
	if (m_idle) {
		wl_event_source_remove(m_idle);
		m_idle = nullptr;
	}
	pending.clear();
	m_loop = nullptr;
}

void
intent_queue::handle_idle(void *data)
{
	auto queue = static_cast<intent_queue *>(data);
	/* idle sources are removed once dispatched */
	queue->m_idle = nullptr;
	queue->drain();
}

void
intent_queue::push(const intent &intent)
{
	if (swc::contains(pending, intent)) {
		return;
	}
	wlr_log(WLR_DEBUG, "queued %s for device %u:%u",
		intent_type_name(intent.type), major(intent.device),
		minor(intent.device));
	pending.push_back(intent);

	if (m_loop && !m_idle) {
		m_idle = wl_event_loop_add_idle(m_loop, handle_idle, this);
	}
}

void
intent_queue::drain()
{
	std::vector<intent> batch;
	batch.swap(pending);
	for (auto &intent : batch) {
		m_handler(intent, m_data);
	}
}
