// SPDX-License-Identifier: GPL-2.0-only
#include <gtest/gtest.h>
#include "fake-toplevel.h"
#include "layout.h"

static const struct wlr_box area = {0, 0, 2560, 1440};

static std::vector<toplevel *>
make_windows(std::vector<fake_toplevel> &storage)
{
	std::vector<toplevel *> windows;
	for (auto &t : storage) {
		windows.push_back(&t);
	}
	return windows;
}

TEST(LayoutTest, NoWindowsGiveNoPlacements)
{
	EXPECT_TRUE(layout_place(master_stack_layout{}, {}, area).empty());
}

TEST(LayoutTest, SingleWindowFillsArea)
{
	std::vector<fake_toplevel> storage(1);
	auto result = layout_place(master_stack_layout{},
		make_windows(storage), area);
	ASSERT_EQ(result.size(), 1u);
	EXPECT_EQ(result[0].client, &storage[0]);
	EXPECT_TRUE(result[0].box == area);
}

TEST(LayoutTest, ThreeWindowsMasterAndStack)
{
	std::vector<fake_toplevel> storage(3);
	auto result = layout_place(master_stack_layout{},
		make_windows(storage), area);
	ASSERT_EQ(result.size(), 3u);

	EXPECT_TRUE(result[0].box == (wlr_box{0, 0, 1280, 1440}));
	EXPECT_TRUE(result[1].box == (wlr_box{1280, 0, 1280, 720}));
	EXPECT_TRUE(result[2].box == (wlr_box{1280, 720, 1280, 720}));
}

TEST(LayoutTest, AreaOffsetIsHonoured)
{
	std::vector<fake_toplevel> storage(2);
	struct wlr_box offset_area = {100, 30, 1000, 600};
	auto result = layout_place(master_stack_layout{},
		make_windows(storage), offset_area);
	ASSERT_EQ(result.size(), 2u);
	EXPECT_TRUE(result[0].box == (wlr_box{100, 30, 500, 600}));
	EXPECT_TRUE(result[1].box == (wlr_box{600, 30, 500, 600}));
}

TEST(LayoutTest, DeterministicAndWithinArea)
{
	for (int count = 0; count <= 7; count++) {
		std::vector<fake_toplevel> storage(count);
		auto windows = make_windows(storage);
		auto first = layout_place(master_stack_layout{}, windows, area);
		auto second = layout_place(master_stack_layout{}, windows, area);
		ASSERT_EQ(first.size(), (size_t)count);
		ASSERT_EQ(second.size(), (size_t)count);

		long total = 0;
		for (int i = 0; i < count; i++) {
			EXPECT_EQ(first[i].client, windows[i]);
			EXPECT_TRUE(first[i].box == second[i].box);
			total += (long)first[i].box.width * first[i].box.height;
		}
		EXPECT_LE(total, (long)area.width * area.height);
	}
}

TEST(LayoutTest, Name)
{
	EXPECT_STREQ(layout_name(master_stack_layout{}), "master-stack");
}
