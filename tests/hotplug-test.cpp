// SPDX-License-Identifier: GPL-2.0-only
#include <gtest/gtest.h>
#include <pixman.h>
#include <sys/sysmacros.h>
#include "config/rcxml.h"
#include "fake-target.h"
#include "fake-toplevel.h"
#include "hotplug.h"

static const struct wlr_box dp_box = {0, 0, 2560, 1440};
static const struct wlr_box hdmi_box = {2560, 0, 1920, 1080};

class HotplugTest : public ::testing::Test
{
protected:
	void SetUp() override {
		rcxml_parse_string(nullptr);
		manager.init(4);
		manager.map_output(1, "DP-1", dp_box);
		manager.map_output(2, "HDMI-A-1", hdmi_box);
		wlr_damage_ring_init(&dp_damage);
		wlr_damage_ring_init(&hdmi_damage);
		outputs = {
			{
				.id = 1,
				.device = card0,
				.scheduler = &dp_scheduler,
				.damage = &dp_damage,
				.width = 2560,
				.height = 1440,
			},
			{
				.id = 2,
				.device = card1,
				.scheduler = &hdmi_scheduler,
				.damage = &hdmi_damage,
				.width = 1920,
				.height = 1080,
			},
		};
	}

	void TearDown() override {
		wlr_damage_ring_finish(&dp_damage);
		wlr_damage_ring_finish(&hdmi_damage);
		manager.finish();
		rcxml_finish();
	}

	const dev_t card0 = makedev(226, 0);
	const dev_t card1 = makedev(226, 1);

	workspace_manager manager;
	fake_target dp_target;
	fake_target hdmi_target;
	frame_scheduler dp_scheduler{nullptr, &dp_target};
	frame_scheduler hdmi_scheduler{nullptr, &hdmi_target};
	struct wlr_damage_ring dp_damage;
	struct wlr_damage_ring hdmi_damage;
	std::vector<hotplug_output> outputs;
	fake_toplevel a{"a"};
};

TEST_F(HotplugTest, RemovingOneDeviceKeepsTheOtherOutput)
{
	manager.insert_window(&a);
	struct wlr_box geometry = manager.find_window(&a)->geometry;
	size_t configures = a.configures.size();

	auto removed = hotplug_remove_device(manager, outputs, card1);
	ASSERT_EQ(removed.size(), 1u);
	EXPECT_EQ(removed[0], 2u);

	for (auto &ws : manager.workspaces) {
		ASSERT_EQ(ws.outputs.size(), 1u);
		EXPECT_EQ(ws.outputs[0].id, 1u);
		EXPECT_TRUE(ws.outputs[0].box == dp_box);
	}
	EXPECT_TRUE(manager.find_window(&a)->geometry == geometry);
	EXPECT_EQ(a.configures.size(), configures);

	/* the remaining output still repaints on damage */
	EXPECT_FALSE(dp_scheduler.paused);
	dp_scheduler.schedule();
	EXPECT_EQ(dp_target.renders, 1);
	EXPECT_EQ(dp_scheduler.state, FRAME_SUBMITTED);

	EXPECT_TRUE(hdmi_scheduler.paused);
	hdmi_scheduler.schedule();
	EXPECT_EQ(hdmi_target.renders, 0);
}

TEST_F(HotplugTest, RemovingTheOnlyDeviceUnmapsEverything)
{
	outputs.pop_back();
	manager.unmap_output(2);
	manager.insert_window(&a);
	struct wlr_box geometry = manager.find_window(&a)->geometry;

	auto removed = hotplug_remove_device(manager, outputs, card0);
	EXPECT_EQ(removed.size(), 1u);
	EXPECT_TRUE(manager.current().outputs.empty());
	/* windows keep their geometry until an output appears */
	EXPECT_TRUE(manager.find_window(&a)->geometry == geometry);
}

TEST_F(HotplugTest, UnknownDeviceChangesNothing)
{
	auto removed = hotplug_remove_device(manager, outputs,
		makedev(226, 7));
	EXPECT_TRUE(removed.empty());
	EXPECT_EQ(manager.current().outputs.size(), 2u);
	EXPECT_FALSE(dp_scheduler.paused);
	EXPECT_FALSE(hdmi_scheduler.paused);
}

TEST_F(HotplugTest, PauseStopsRepaints)
{
	hotplug_session_paused(outputs);
	dp_scheduler.schedule();
	hdmi_scheduler.schedule();
	EXPECT_EQ(dp_target.renders, 0);
	EXPECT_EQ(hdmi_target.renders, 0);
}

TEST_F(HotplugTest, ResumeRepaintsWholeOutputs)
{
	hotplug_session_paused(outputs);
	EXPECT_FALSE(pixman_region32_not_empty(&dp_damage.current));

	hotplug_session_resumed(outputs);

	EXPECT_FALSE(dp_scheduler.paused);
	EXPECT_EQ(dp_target.renders, 1);
	EXPECT_EQ(dp_scheduler.state, FRAME_SUBMITTED);
	EXPECT_EQ(hdmi_target.renders, 1);

	pixman_box32_t *extents = pixman_region32_extents(&dp_damage.current);
	EXPECT_EQ(extents->x1, 0);
	EXPECT_EQ(extents->y1, 0);
	EXPECT_EQ(extents->x2, 2560);
	EXPECT_EQ(extents->y2, 1440);

	extents = pixman_region32_extents(&hdmi_damage.current);
	EXPECT_EQ(extents->x2, 1920);
	EXPECT_EQ(extents->y2, 1080);
}
