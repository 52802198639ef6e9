/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_TESTS_FAKE_TARGET_H
#define STACKWC_TESTS_FAKE_TARGET_H

#include <vector>
#include "frame-scheduler.h"

/* Output stand-in replaying queued render results */
struct fake_target : public frame_target {
	std::vector<enum render_result> results;
	int renders = 0;
	int frame_done = 0;

	enum render_result render_frame() override {
		enum render_result result = RENDER_SUBMITTED;
		if (!results.empty()) {
			result = results.front();
			results.erase(results.begin());
		}
		renders++;
		return result;
	}
	void send_frame_done(const struct timespec *now) override {
		frame_done++;
	}
	const char *target_name() override { return "fake"; }
};

#endif /* STACKWC_TESTS_FAKE_TARGET_H */
