// SPDX-License-Identifier: GPL-2.0-only
#include <gtest/gtest.h>
#include <sys/sysmacros.h>
#include "intent.h"

struct recorder {
	intent_queue *queue;
	std::vector<intent> handled;
	/* pushed from inside the handler, once */
	bool push_from_handler = false;
};

static void
record(const intent &intent, void *data)
{
	auto rec = static_cast<recorder *>(data);
	rec->handled.push_back(intent);
	if (rec->push_from_handler) {
		rec->push_from_handler = false;
		rec->queue->push({INTENT_READD_DEVICE, intent.device});
	}
}

class IntentTest : public ::testing::Test
{
protected:
	void SetUp() override {
		rec.queue = &queue;
		queue.init(nullptr, record, &rec);
	}
	void TearDown() override { queue.finish(); }

	intent_queue queue;
	recorder rec;
};

TEST_F(IntentTest, DrainHandlesInOrder)
{
	queue.push({INTENT_RELEASE_DEVICE, makedev(226, 0)});
	queue.push({INTENT_READD_DEVICE, makedev(226, 1)});
	EXPECT_TRUE(rec.handled.empty());

	queue.drain();
	ASSERT_EQ(rec.handled.size(), 2u);
	EXPECT_EQ(rec.handled[0].type, INTENT_RELEASE_DEVICE);
	EXPECT_EQ(rec.handled[0].device, makedev(226, 0));
	EXPECT_EQ(rec.handled[1].type, INTENT_READD_DEVICE);
	EXPECT_TRUE(queue.pending.empty());
}

TEST_F(IntentTest, DuplicatesAreMerged)
{
	queue.push({INTENT_RELEASE_DEVICE, makedev(226, 0)});
	queue.push({INTENT_RELEASE_DEVICE, makedev(226, 0)});
	queue.push({INTENT_READD_DEVICE, makedev(226, 0)});
	EXPECT_EQ(queue.pending.size(), 2u);
}

TEST_F(IntentTest, PushFromHandlerWaitsForNextDrain)
{
	rec.push_from_handler = true;
	queue.push({INTENT_RELEASE_DEVICE, makedev(226, 0)});

	queue.drain();
	ASSERT_EQ(rec.handled.size(), 1u);
	ASSERT_EQ(queue.pending.size(), 1u);
	EXPECT_EQ(queue.pending[0].type, INTENT_READD_DEVICE);

	queue.drain();
	ASSERT_EQ(rec.handled.size(), 2u);
	EXPECT_EQ(rec.handled[1].type, INTENT_READD_DEVICE);
	EXPECT_TRUE(queue.pending.empty());
}

TEST_F(IntentTest, FinishDropsPending)
{
	queue.push({INTENT_RELEASE_DEVICE, makedev(226, 0)});
	queue.finish();
	EXPECT_TRUE(queue.pending.empty());
}

TEST(IntentLoopTest, HandledFromIdleDispatch)
{
	struct wl_event_loop *loop = wl_event_loop_create();
	ASSERT_NE(loop, nullptr);
	intent_queue queue;
	recorder rec;
	rec.queue = &queue;
	queue.init(loop, record, &rec);

	rec.push_from_handler = true;
	queue.push({INTENT_RELEASE_DEVICE, makedev(226, 0)});
	EXPECT_TRUE(rec.handled.empty());

	/* the intent pushed by the handler runs in the same pass */
	wl_event_loop_dispatch_idle(loop);
	ASSERT_EQ(rec.handled.size(), 2u);
	EXPECT_EQ(rec.handled[0].type, INTENT_RELEASE_DEVICE);
	EXPECT_EQ(rec.handled[1].type, INTENT_READD_DEVICE);
	EXPECT_TRUE(queue.pending.empty());

	queue.finish();
	wl_event_loop_destroy(loop);
}

TEST(IntentTypeTest, Names)
{
	EXPECT_STREQ(intent_type_name(INTENT_RELEASE_DEVICE), "release_device");
	EXPECT_STREQ(intent_type_name(INTENT_READD_DEVICE), "readd_device");
}
