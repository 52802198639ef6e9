// SPDX-License-Identifier: GPL-2.0-only
#include "frame-scheduler.h"
#include <assert.h>
#include <wlr/util/log.h>

#define DEFAULT_REFRESH_MHZ 60000
#define NSEC_PER_SEC 1000000000LL

static int64_t
timespec_to_ns(const struct timespec *ts)
{
	return (int64_t)ts->tv_sec * NSEC_PER_SEC + ts->tv_nsec;
}

const char *
frame_state_name(enum frame_state state)
{
	switch (state) {
	case FRAME_IDLE:
		return "idle";
	case FRAME_RENDERING:
		return "rendering";
	case FRAME_SUBMITTED:
		return "submitted";
	case FRAME_THROTTLED:
		return "throttled";
	}
	return "unknown";
}

static int
handle_throttle_timer(void *data)
{
	static_cast<frame_scheduler *>(data)->on_throttle_timer();
	return 0;
}

static int
handle_feedback_timer(void *data)
{
	struct timespec now;
	clock_gettime(CLOCK_MONOTONIC, &now);
	static_cast<frame_scheduler *>(data)->on_feedback_timer(&now);
	return 0;
}

frame_scheduler::frame_scheduler(struct wl_event_loop *loop,
		frame_target *target)
	: m_target(target)
{
	assert(target);
	if (loop) {
		m_throttle_timer = wl_event_loop_add_timer(loop,
			handle_throttle_timer, this);
		m_feedback_timer = wl_event_loop_add_timer(loop,
			handle_feedback_timer, this);
	}
}

frame_scheduler::~frame_scheduler()
{
	if (m_throttle_timer) {
		wl_event_source_remove(m_throttle_timer);
	}
	if (m_feedback_timer) {
		wl_event_source_remove(m_feedback_timer);
	}
}

int
frame_scheduler::reschedule_delay_ms() const
{
	int mhz = refresh_mhz > 0 ? refresh_mhz : DEFAULT_REFRESH_MHZ;
	return 1000000 / mhz;
}

void
frame_scheduler::arm_throttle()
{
	throttle_pending = true;
	throttle_delay_ms = reschedule_delay_ms();
	if (m_throttle_timer) {
		/* a zero delay would disarm the timer */
		wl_event_source_timer_update(m_throttle_timer,
			throttle_delay_ms > 0 ? throttle_delay_ms : 1);
	}
}

void
frame_scheduler::disarm_throttle()
{
	throttle_pending = false;
	if (m_throttle_timer) {
		wl_event_source_timer_update(m_throttle_timer, 0);
	}
}

void
frame_scheduler::repaint()
{
	if (paused) {
		state = FRAME_IDLE;
		return;
	}

	state = FRAME_RENDERING;
	enum render_result result = m_target->render_frame();

	switch (result) {
	case RENDER_SUBMITTED:
		state = FRAME_SUBMITTED;
		break;
	case RENDER_NO_DAMAGE:
		state = FRAME_THROTTLED;
		arm_throttle();
		break;
	case RENDER_DEVICE_INACTIVE:
		state = FRAME_IDLE;
		break;
	case RENDER_FAILED:
		wlr_log(WLR_ERROR, "rendering %s failed, retrying in %d ms",
			m_target->target_name(), reschedule_delay_ms());
		state = FRAME_THROTTLED;
		arm_throttle();
		break;
	}
}

void
frame_scheduler::schedule()
{
	if (paused) {
		return;
	}
	switch (state) {
	case FRAME_IDLE:
		repaint();
		break;
	case FRAME_THROTTLED:
		disarm_throttle();
		repaint();
		break;
	case FRAME_SUBMITTED:
		/* the vblank of the queued frame repaints */
		break;
	case FRAME_RENDERING:
		break;
	}
}

void
frame_scheduler::on_vblank()
{
	if (state != FRAME_SUBMITTED && state != FRAME_IDLE) {
		wlr_log(WLR_DEBUG, "%s: vblank while %s",
			m_target->target_name(), frame_state_name(state));
		return;
	}
	state = FRAME_IDLE;
	repaint();
}

void
frame_scheduler::on_throttle_timer()
{
	throttle_pending = false;
	if (state != FRAME_THROTTLED) {
		return;
	}
	state = FRAME_IDLE;
	repaint();
}

int64_t
frame_scheduler::feedback_delay_ns(const struct timespec *now)
{
	int mhz = refresh_mhz > 0 ? refresh_mhz : DEFAULT_REFRESH_MHZ;
	int64_t interval = NSEC_PER_SEC * 1000 / mhz;
	int64_t elapsed = timespec_to_ns(now) - timespec_to_ns(&last_presentation);
	int64_t remaining = interval - elapsed;

	if (remaining > interval / 2) {
		return remaining;
	}
	last_presentation = *now;
	return 0;
}

void
frame_scheduler::on_present(const struct timespec *now)
{
	if (feedback_pending) {
		/* callbacks for the previous frame are still held back */
		return;
	}
	int64_t delay = feedback_delay_ns(now);
	if (!delay) {
		m_target->send_frame_done(now);
		return;
	}

	feedback_pending = true;
	feedback_delay_ns_value = delay;
	if (m_feedback_timer) {
		int ms = (int)((delay + 999999) / 1000000);
		wl_event_source_timer_update(m_feedback_timer, ms);
	}
	wlr_log(WLR_DEBUG, "%s: frame callbacks deferred by %lld ns",
		m_target->target_name(), (long long)delay);
}

void
frame_scheduler::on_dropped(const struct timespec *now)
{
	if (feedback_pending) {
		/* the feedback timer sends them */
		return;
	}
	wlr_log(WLR_DEBUG, "%s: frame not presented", m_target->target_name());
	m_target->send_frame_done(now);
}

void
frame_scheduler::on_feedback_timer(const struct timespec *now)
{
	if (!feedback_pending) {
		return;
	}
	feedback_pending = false;
	last_presentation = *now;
	m_target->send_frame_done(now);
}

void
frame_scheduler::pause()
{
	paused = true;
	disarm_throttle();
	state = FRAME_IDLE;
}

void
frame_scheduler::resume()
{
	paused = false;
	state = FRAME_IDLE;
	repaint();
}
