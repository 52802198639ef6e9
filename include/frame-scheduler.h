/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_FRAME_SCHEDULER_H
#define STACKWC_FRAME_SCHEDULER_H

#include <stdint.h>
#include <time.h>
#include <wayland-server-core.h>

enum frame_state {
	FRAME_IDLE = 0,
	FRAME_RENDERING,
	/* a frame is queued, waiting for vblank */
	FRAME_SUBMITTED,
	/* nothing to show; re-check after one refresh interval */
	FRAME_THROTTLED,
};

enum render_result {
	RENDER_SUBMITTED = 0,
	RENDER_NO_DAMAGE,
	/* session paused or output disabled */
	RENDER_DEVICE_INACTIVE,
	RENDER_FAILED,
};

/* What a frame_scheduler drives, i.e. an output */
struct frame_target {
	virtual ~frame_target() {}
	virtual enum render_result render_frame() = 0;
	/* Send wl_surface.frame callbacks to the visible clients */
	virtual void send_frame_done(const struct timespec *now) = 0;
	virtual const char *target_name() = 0;
};

/*
 * Per-output repaint state machine.
 *
 * Repaints are triggered by damage (schedule()), by the end of a
 * frame (on_vblank()) and by the throttle timer. Only one frame is in
 * flight at a time. A NULL event loop is accepted for unit tests, in
 * which case the timers are only tracked, never armed.
 */
struct frame_scheduler {
	frame_scheduler(struct wl_event_loop *loop, frame_target *target);
	~frame_scheduler();

	frame_scheduler(const frame_scheduler &) = delete;
	frame_scheduler &operator=(const frame_scheduler &) = delete;

	enum frame_state state = FRAME_IDLE;
	bool paused = false;
	/* 0 if unknown */
	int refresh_mhz = 0;
	struct timespec last_presentation = {};

	/* armed state of the timers */
	bool throttle_pending = false;
	int throttle_delay_ms = 0;
	bool feedback_pending = false;
	int64_t feedback_delay_ns_value = 0;

	/* Damage arrived or a repaint was requested */
	void schedule();
	/* The frame submitted last has been shown */
	void on_vblank();
	/* Presentation feedback: send or defer the frame callbacks */
	void on_present(const struct timespec *now);
	/* The frame was discarded, clients must not wait for it */
	void on_dropped(const struct timespec *now);

	void pause();
	void resume();

	void on_throttle_timer();
	void on_feedback_timer(const struct timespec *now);

	int reschedule_delay_ms() const;
	/* Nanoseconds to hold back frame callbacks, 0 to send them now */
	int64_t feedback_delay_ns(const struct timespec *now);

private:
	void repaint();
	void arm_throttle();
	void disarm_throttle();

	frame_target *const m_target;
	struct wl_event_source *m_throttle_timer = nullptr;
	struct wl_event_source *m_feedback_timer = nullptr;
};

const char *frame_state_name(enum frame_state state);

#endif /* STACKWC_FRAME_SCHEDULER_H */
