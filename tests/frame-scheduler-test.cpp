// SPDX-License-Identifier: GPL-2.0-only
#include <gtest/gtest.h>
#include "fake-target.h"
#include "frame-scheduler.h"

static struct timespec
ms(int64_t msec)
{
	return {
		.tv_sec = (time_t)(msec / 1000),
		.tv_nsec = (long)(msec % 1000) * 1000000,
	};
}

class FrameSchedulerTest : public ::testing::Test
{
protected:
	fake_target target;
	frame_scheduler scheduler{nullptr, &target};
};

TEST_F(FrameSchedulerTest, DamageRendersWhenIdle)
{
	EXPECT_EQ(scheduler.state, FRAME_IDLE);
	scheduler.schedule();
	EXPECT_EQ(target.renders, 1);
	EXPECT_EQ(scheduler.state, FRAME_SUBMITTED);
}

TEST_F(FrameSchedulerTest, OneFrameInFlight)
{
	scheduler.schedule();
	scheduler.schedule();
	scheduler.schedule();
	EXPECT_EQ(target.renders, 1);

	/* the vblank repaints whatever accumulated */
	scheduler.on_vblank();
	EXPECT_EQ(target.renders, 2);
	EXPECT_EQ(scheduler.state, FRAME_SUBMITTED);
}

TEST_F(FrameSchedulerTest, NoDamageThrottles)
{
	target.results = {RENDER_SUBMITTED, RENDER_NO_DAMAGE};
	scheduler.schedule();
	scheduler.on_vblank();

	EXPECT_EQ(scheduler.state, FRAME_THROTTLED);
	EXPECT_TRUE(scheduler.throttle_pending);
	EXPECT_EQ(scheduler.throttle_delay_ms, scheduler.reschedule_delay_ms());

	/* timer fires and there is still nothing to draw */
	target.results = {RENDER_NO_DAMAGE};
	scheduler.on_throttle_timer();
	EXPECT_EQ(target.renders, 3);
	EXPECT_EQ(scheduler.state, FRAME_THROTTLED);
}

TEST_F(FrameSchedulerTest, DamageWhileThrottledRendersAtOnce)
{
	target.results = {RENDER_NO_DAMAGE};
	scheduler.schedule();
	ASSERT_EQ(scheduler.state, FRAME_THROTTLED);

	scheduler.schedule();
	EXPECT_EQ(target.renders, 2);
	EXPECT_EQ(scheduler.state, FRAME_SUBMITTED);
	EXPECT_FALSE(scheduler.throttle_pending);

	/* a stale timer does nothing */
	scheduler.on_throttle_timer();
	EXPECT_EQ(target.renders, 2);
}

TEST_F(FrameSchedulerTest, FailureRetriesAfterInterval)
{
	target.results = {RENDER_FAILED};
	scheduler.schedule();
	EXPECT_EQ(scheduler.state, FRAME_THROTTLED);
	EXPECT_TRUE(scheduler.throttle_pending);

	scheduler.on_throttle_timer();
	EXPECT_EQ(target.renders, 2);
	EXPECT_EQ(scheduler.state, FRAME_SUBMITTED);
}

TEST_F(FrameSchedulerTest, InactiveDeviceGoesIdle)
{
	target.results = {RENDER_DEVICE_INACTIVE};
	scheduler.schedule();
	EXPECT_EQ(scheduler.state, FRAME_IDLE);
	EXPECT_FALSE(scheduler.throttle_pending);
}

TEST_F(FrameSchedulerTest, PausedSchedulerDoesNotRender)
{
	target.results = {RENDER_NO_DAMAGE};
	scheduler.schedule();
	scheduler.pause();
	EXPECT_EQ(scheduler.state, FRAME_IDLE);
	EXPECT_FALSE(scheduler.throttle_pending);

	scheduler.schedule();
	EXPECT_EQ(target.renders, 1);

	scheduler.resume();
	EXPECT_FALSE(scheduler.paused);
	EXPECT_EQ(target.renders, 2);
	EXPECT_EQ(scheduler.state, FRAME_SUBMITTED);
}

TEST_F(FrameSchedulerTest, RescheduleDelayFollowsRefresh)
{
	/* unknown refresh counts as 60 Hz */
	EXPECT_EQ(scheduler.reschedule_delay_ms(), 16);
	scheduler.refresh_mhz = 144000;
	EXPECT_EQ(scheduler.reschedule_delay_ms(), 6);
	scheduler.refresh_mhz = 30000;
	EXPECT_EQ(scheduler.reschedule_delay_ms(), 33);
}

TEST_F(FrameSchedulerTest, RegularPresentationSendsFeedback)
{
	scheduler.refresh_mhz = 60000;
	struct timespec t0 = ms(1000);
	scheduler.on_present(&t0);
	EXPECT_EQ(target.frame_done, 1);

	struct timespec t1 = ms(1017);
	scheduler.on_present(&t1);
	EXPECT_EQ(target.frame_done, 2);
	EXPECT_FALSE(scheduler.feedback_pending);
}

TEST_F(FrameSchedulerTest, EarlyPresentationDefersFeedback)
{
	scheduler.refresh_mhz = 50000; /* 20 ms */
	struct timespec t0 = ms(1000);
	scheduler.on_present(&t0);
	ASSERT_EQ(target.frame_done, 1);

	/* 4 ms later, well under half an interval */
	struct timespec t1 = ms(1004);
	scheduler.on_present(&t1);
	EXPECT_EQ(target.frame_done, 1);
	EXPECT_TRUE(scheduler.feedback_pending);
	EXPECT_EQ(scheduler.feedback_delay_ns_value, 16000000);

	/* held back callbacks are not stacked up */
	struct timespec t2 = ms(1006);
	scheduler.on_present(&t2);
	EXPECT_EQ(target.frame_done, 1);

	struct timespec t3 = ms(1020);
	scheduler.on_feedback_timer(&t3);
	EXPECT_EQ(target.frame_done, 2);
	EXPECT_FALSE(scheduler.feedback_pending);

	/* a late timer after that does nothing */
	scheduler.on_feedback_timer(&t3);
	EXPECT_EQ(target.frame_done, 2);
}

TEST_F(FrameSchedulerTest, DroppedFrameReleasesCallbacks)
{
	scheduler.refresh_mhz = 60000;
	struct timespec t0 = ms(1000);
	scheduler.on_present(&t0);
	ASSERT_EQ(target.frame_done, 1);

	/* clients do not wait for the next successful present */
	struct timespec t1 = ms(1002);
	scheduler.on_dropped(&t1);
	EXPECT_EQ(target.frame_done, 2);
	EXPECT_FALSE(scheduler.feedback_pending);
	/* presentation pacing is unaffected */
	EXPECT_EQ(scheduler.last_presentation.tv_nsec, t0.tv_nsec);
}

TEST_F(FrameSchedulerTest, DroppedFrameLeavesDeferredFeedbackToTimer)
{
	scheduler.refresh_mhz = 50000;
	struct timespec t0 = ms(1000);
	scheduler.on_present(&t0);
	struct timespec t1 = ms(1004);
	scheduler.on_present(&t1);
	ASSERT_TRUE(scheduler.feedback_pending);

	struct timespec t2 = ms(1008);
	scheduler.on_dropped(&t2);
	EXPECT_EQ(target.frame_done, 1);

	struct timespec t3 = ms(1020);
	scheduler.on_feedback_timer(&t3);
	EXPECT_EQ(target.frame_done, 2);
}

TEST(FrameStateTest, Names)
{
	EXPECT_STREQ(frame_state_name(FRAME_IDLE), "idle");
	EXPECT_STREQ(frame_state_name(FRAME_THROTTLED), "throttled");
}
