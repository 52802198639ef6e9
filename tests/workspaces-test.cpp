// SPDX-License-Identifier: GPL-2.0-only
#include <gtest/gtest.h>
#include "config/rcxml.h"
#include "fake-toplevel.h"
#include "workspaces.h"

static const struct wlr_box output_box = {0, 0, 2560, 1440};

static std::vector<toplevel *> focus_calls;
static int damage_calls;

static void
record_focus(struct toplevel *client)
{
	focus_calls.push_back(client);
}

static void
record_damage(void)
{
	damage_calls++;
}

class WorkspacesTest : public ::testing::Test
{
protected:
	void SetUp() override {
		rcxml_parse_string(nullptr);
		focus_calls.clear();
		damage_calls = 0;
		manager.init(4);
		manager.hooks = {
			.focus = record_focus,
			.damage = record_damage,
		};
		manager.map_output(1, "DP-1", output_box);
	}

	void TearDown() override {
		manager.finish();
		rcxml_finish();
	}

	/* distance between the layout box and the window geometry */
	int offset() const { return rc.gap + rc.border_thickness; }

	workspace_manager manager;
	fake_toplevel a{"a"};
	fake_toplevel b{"b"};
	fake_toplevel c{"c"};
};

TEST_F(WorkspacesTest, FirstWindowTakesTheWholeOutput)
{
	manager.insert_window(&a);

	window *win = manager.find_window(&a);
	ASSERT_NE(win, nullptr);
	EXPECT_EQ(win->mode, WINDOW_MODE_TILED);
	int o = offset();
	EXPECT_TRUE(win->geometry == (wlr_box{o, o, 2560 - 2 * o, 1440 - 2 * o}));
	ASSERT_FALSE(a.configures.empty());
	EXPECT_TRUE(a.configures.back() == win->geometry);
	EXPECT_TRUE(manager.current().active == &a);
	EXPECT_TRUE(a.activated);
	ASSERT_FALSE(focus_calls.empty());
	EXPECT_EQ(focus_calls.back(), &a);
}

TEST_F(WorkspacesTest, SecondWindowSplitsTheOutput)
{
	manager.insert_window(&a);
	manager.insert_window(&b);

	int o = offset();
	EXPECT_TRUE(manager.find_window(&a)->geometry
		== (wlr_box{o, o, 1280 - 2 * o, 1440 - 2 * o}));
	EXPECT_TRUE(manager.find_window(&b)->geometry
		== (wlr_box{1280 + o, o, 1280 - 2 * o, 1440 - 2 * o}));
	EXPECT_TRUE(manager.current().active == &b);
	EXPECT_FALSE(a.activated);
	EXPECT_TRUE(b.activated);
	EXPECT_TRUE(manager.current().previous == &a);
}

TEST_F(WorkspacesTest, InsertIsIdempotent)
{
	manager.insert_window(&a);
	manager.insert_window(&a);
	EXPECT_EQ(manager.current().windows.size(), 1u);
}

TEST_F(WorkspacesTest, MoveWindowSwapsTilingOrder)
{
	manager.insert_window(&a);
	manager.insert_window(&b);
	struct wlr_box a_geo = manager.find_window(&a)->geometry;
	struct wlr_box b_geo = manager.find_window(&b)->geometry;

	manager.set_active(&a);
	struct wlr_point pointer;
	ASSERT_TRUE(manager.move_window(SWC_EDGE_RIGHT, &pointer));

	workspace &ws = manager.current();
	ASSERT_EQ(ws.windows.size(), 2u);
	EXPECT_EQ(ws.windows[0].client, &b);
	EXPECT_EQ(ws.windows[1].client, &a);
	EXPECT_TRUE(manager.find_window(&a)->geometry == b_geo);
	EXPECT_TRUE(manager.find_window(&b)->geometry == a_geo);
	EXPECT_EQ(pointer.x, b_geo.x + b_geo.width / 2);
	EXPECT_EQ(pointer.y, b_geo.y + b_geo.height / 2);

	/* nothing further right */
	EXPECT_FALSE(manager.move_window(SWC_EDGE_RIGHT, &pointer));
}

TEST_F(WorkspacesTest, ChangeFocusIsReversible)
{
	manager.insert_window(&a);
	manager.insert_window(&b);
	struct wlr_box a_geo = manager.find_window(&a)->geometry;
	struct wlr_box b_geo = manager.find_window(&b)->geometry;

	struct wlr_point pointer;
	ASSERT_TRUE(manager.change_focus(SWC_EDGE_LEFT, &pointer));
	EXPECT_EQ(pointer.x, a_geo.x + a_geo.width / 2);
	EXPECT_EQ(pointer.y, a_geo.y + a_geo.height / 2);

	manager.set_active(manager.window_at(pointer.x, pointer.y));
	EXPECT_TRUE(manager.current().active == &a);

	ASSERT_TRUE(manager.change_focus(SWC_EDGE_RIGHT, &pointer));
	EXPECT_EQ(pointer.x, b_geo.x + b_geo.width / 2);
	EXPECT_EQ(manager.window_at(pointer.x, pointer.y), &b);

	/* vertical neighbours do not exist in a two-window layout */
	EXPECT_FALSE(manager.change_focus(SWC_EDGE_TOP, &pointer));
	EXPECT_FALSE(manager.change_focus(SWC_EDGE_BOTTOM, &pointer));
}

TEST_F(WorkspacesTest, BestCandidateIsNearest)
{
	manager.insert_window(&a);
	manager.insert_window(&b);
	manager.insert_window(&c);
	workspace &ws = manager.current();

	/* b is above c in the stack */
	window *from = ws.find(&c);
	window *up = workspace_best_candidate(ws, *from, SWC_EDGE_TOP);
	ASSERT_NE(up, nullptr);
	EXPECT_EQ(up->client, &b);
	window *left = workspace_best_candidate(ws, *from, SWC_EDGE_LEFT);
	ASSERT_NE(left, nullptr);
	EXPECT_EQ(left->client, &a);
	EXPECT_EQ(workspace_best_candidate(ws, *from, SWC_EDGE_BOTTOM),
		nullptr);
}

TEST_F(WorkspacesTest, FullscreenRoundTrip)
{
	manager.insert_window(&a);
	manager.insert_window(&b);
	struct wlr_box before = manager.find_window(&a)->geometry;

	ASSERT_TRUE(manager.set_fullscreen(&a, true));
	window *win = manager.find_window(&a);
	EXPECT_EQ(win->mode, WINDOW_MODE_FULLSCREEN);
	EXPECT_TRUE(win->geometry == output_box);
	EXPECT_TRUE(a.fullscreen);
	EXPECT_TRUE(manager.current().fullscreen_restore == before);

	/* fullscreen shows one window only */
	auto order = manager.current().stacking_order();
	ASSERT_EQ(order.size(), 1u);
	EXPECT_EQ(order[0]->client, &a);

	ASSERT_TRUE(manager.set_fullscreen(&a, false));
	win = manager.find_window(&a);
	EXPECT_EQ(win->mode, WINDOW_MODE_TILED);
	EXPECT_TRUE(win->geometry == before);
	EXPECT_FALSE(a.fullscreen);
	EXPECT_TRUE(manager.current().fullscreen_restore == (wlr_box{}));

	EXPECT_FALSE(manager.set_fullscreen(&a, false));
}

TEST_F(WorkspacesTest, FullscreenReplacesPreviousOne)
{
	manager.insert_window(&a);
	manager.insert_window(&b);

	ASSERT_TRUE(manager.set_fullscreen(&a, true));
	ASSERT_TRUE(manager.set_fullscreen(&b, true));

	/* a is back in the tiling, alone now that b is fullscreen */
	int o = offset();
	EXPECT_EQ(manager.find_window(&a)->mode, WINDOW_MODE_TILED);
	EXPECT_TRUE(manager.find_window(&a)->geometry
		== (wlr_box{o, o, 2560 - 2 * o, 1440 - 2 * o}));
	EXPECT_FALSE(a.fullscreen);
	EXPECT_EQ(manager.find_window(&b)->mode, WINDOW_MODE_FULLSCREEN);
	EXPECT_EQ(manager.current().fullscreen_window()->client, &b);
}

TEST_F(WorkspacesTest, WindowMappedDuringFullscreenStaysBehind)
{
	manager.insert_window(&a);
	ASSERT_TRUE(manager.set_fullscreen(&a, true));
	focus_calls.clear();

	manager.insert_window(&b);

	ASSERT_NE(manager.find_window(&b), nullptr);
	EXPECT_EQ(manager.find_window(&b)->mode, WINDOW_MODE_TILED);
	EXPECT_TRUE(manager.current().active == &a);
	EXPECT_TRUE(a.activated);
	EXPECT_FALSE(b.activated);
	EXPECT_TRUE(focus_calls.empty());

	auto order = manager.current().stacking_order();
	ASSERT_EQ(order.size(), 1u);
	EXPECT_EQ(order[0]->client, &a);

	/* visible once fullscreen ends */
	ASSERT_TRUE(manager.set_fullscreen(&a, false));
	EXPECT_EQ(manager.current().stacking_order().size(), 2u);
}

TEST_F(WorkspacesTest, WindowMappedFullscreenTakesFocus)
{
	manager.insert_window(&a);
	ASSERT_TRUE(manager.set_fullscreen(&a, true));
	manager.insert_window(&b);
	focus_calls.clear();

	ASSERT_TRUE(manager.set_fullscreen(&b, true));
	EXPECT_TRUE(manager.current().active == &b);
	EXPECT_TRUE(b.activated);
	EXPECT_FALSE(a.activated);
	ASSERT_FALSE(focus_calls.empty());
	EXPECT_EQ(focus_calls.back(), &b);
}

TEST_F(WorkspacesTest, FullscreenFloatingWindowReturnsToFloating)
{
	manager.insert_window(&a);
	struct wlr_box geo = {200, 100, 640, 480};
	ASSERT_TRUE(manager.place_floating(&a, geo));

	ASSERT_TRUE(manager.set_fullscreen(&a, true));
	ASSERT_TRUE(manager.set_fullscreen(&a, false));
	EXPECT_EQ(manager.find_window(&a)->mode, WINDOW_MODE_FLOATING);
	EXPECT_TRUE(manager.find_window(&a)->geometry == geo);
}

TEST_F(WorkspacesTest, MoveToWorkspaceKeepsWindowUnique)
{
	manager.insert_window(&a);
	manager.insert_window(&b);

	ASSERT_TRUE(manager.move_window_to_workspace(2));

	EXPECT_EQ(manager.active_index, 2u);
	EXPECT_EQ(manager.workspaces[0].find(&b), nullptr);
	EXPECT_EQ(manager.workspaces[0].windows.size(), 1u);
	ASSERT_EQ(manager.workspaces[2].windows.size(), 1u);
	EXPECT_EQ(manager.workspaces[2].windows[0].client, &b);
	EXPECT_TRUE(manager.current().active == &b);

	int count = 0;
	for (auto &ws : manager.workspaces) {
		count += ws.find(&b) ? 1 : 0;
	}
	EXPECT_EQ(count, 1);

	/* a is alone on workspace 1 again */
	int o = offset();
	EXPECT_TRUE(manager.workspaces[0].find(&a)->geometry
		== (wlr_box{o, o, 2560 - 2 * o, 1440 - 2 * o}));
}

TEST_F(WorkspacesTest, MoveToCurrentOrMissingWorkspaceIsNoop)
{
	manager.insert_window(&a);
	EXPECT_FALSE(manager.move_window_to_workspace(0));
	EXPECT_FALSE(manager.move_window_to_workspace(4));
	EXPECT_EQ(manager.workspaces[0].windows.size(), 1u);
}

TEST_F(WorkspacesTest, SwitchingWorkspaceHidesWindows)
{
	manager.insert_window(&a);
	ASSERT_TRUE(manager.set_active_workspace(1));
	EXPECT_FALSE(a.visible);
	EXPECT_EQ(focus_calls.back(), nullptr);

	manager.insert_window(&b);
	ASSERT_TRUE(manager.set_active_workspace(0));
	EXPECT_TRUE(a.visible);
	EXPECT_FALSE(b.visible);
	EXPECT_EQ(focus_calls.back(), &a);

	EXPECT_FALSE(manager.set_active_workspace(0));
	EXPECT_FALSE(manager.set_active_workspace(10));
}

TEST_F(WorkspacesTest, RemoveActiveWindowClearsFocus)
{
	manager.insert_window(&a);
	manager.insert_window(&b);
	int damage_before = damage_calls;

	manager.remove_window(&b);
	EXPECT_EQ(manager.find_window(&b), nullptr);
	EXPECT_FALSE(manager.current().active);
	EXPECT_EQ(focus_calls.back(), nullptr);
	EXPECT_GT(damage_calls, damage_before);

	int o = offset();
	EXPECT_TRUE(manager.find_window(&a)->geometry
		== (wlr_box{o, o, 2560 - 2 * o, 1440 - 2 * o}));
}

TEST_F(WorkspacesTest, DestroyedClientLeavesNoDanglingActive)
{
	{
		fake_toplevel gone("gone");
		manager.insert_window(&gone);
		manager.remove_window(&gone);
	}
	EXPECT_EQ(manager.current().active.get(), nullptr);
	EXPECT_EQ(manager.current().previous.get(), nullptr);
}

TEST_F(WorkspacesTest, ToggleFloatingStacksAboveTiled)
{
	manager.insert_window(&a);
	manager.insert_window(&b);
	struct wlr_box b_geo = manager.find_window(&b)->geometry;

	ASSERT_TRUE(manager.toggle_floating(&b));
	EXPECT_EQ(manager.find_window(&b)->mode, WINDOW_MODE_FLOATING);
	/* floating windows keep their place */
	EXPECT_TRUE(manager.find_window(&b)->geometry == b_geo);

	int o = offset();
	EXPECT_TRUE(manager.find_window(&a)->geometry
		== (wlr_box{o, o, 2560 - 2 * o, 1440 - 2 * o}));

	auto order = manager.current().stacking_order();
	ASSERT_EQ(order.size(), 2u);
	EXPECT_EQ(order[0]->client, &a);
	EXPECT_EQ(order[1]->client, &b);
	EXPECT_EQ(manager.window_at(b_geo.x + 1, b_geo.y + 1), &b);

	ASSERT_TRUE(manager.toggle_floating(&b));
	EXPECT_EQ(manager.find_window(&b)->mode, WINDOW_MODE_TILED);
}

TEST_F(WorkspacesTest, ActiveFloatingWindowIsRaised)
{
	manager.insert_window(&a);
	manager.insert_window(&b);
	manager.place_floating(&a, {10, 10, 300, 300});
	manager.place_floating(&b, {20, 20, 300, 300});

	manager.set_active(&a);
	auto order = manager.current().stacking_order();
	ASSERT_EQ(order.size(), 2u);
	EXPECT_EQ(order.back()->client, &a);
	EXPECT_EQ(manager.window_at(100, 100), &a);

	manager.set_active(&b);
	EXPECT_EQ(manager.window_at(100, 100), &b);
}

TEST_F(WorkspacesTest, PlaceFloatingOnlyConfiguresOnResize)
{
	manager.insert_window(&a);
	manager.place_floating(&a, {10, 10, 300, 300});
	size_t configures = a.configures.size();

	manager.place_floating(&a, {50, 60, 300, 300});
	EXPECT_EQ(a.configures.size(), configures);
	EXPECT_TRUE(manager.find_window(&a)->geometry
		== (wlr_box{50, 60, 300, 300}));

	manager.place_floating(&a, {50, 60, 400, 300});
	EXPECT_EQ(a.configures.size(), configures + 1);
}

TEST_F(WorkspacesTest, UsableAreaShrinksTiledWindows)
{
	manager.insert_window(&a);
	manager.update_output_area(1, {0, 30, 2560, 1410});

	int o = offset();
	EXPECT_TRUE(manager.find_window(&a)->geometry
		== (wlr_box{o, 30 + o, 2560 - 2 * o, 1410 - 2 * o}));
	for (auto &ws : manager.workspaces) {
		ASSERT_EQ(ws.outputs.size(), 1u);
		EXPECT_TRUE(ws.outputs[0].usable == (wlr_box{0, 30, 2560, 1410}));
	}
}

TEST_F(WorkspacesTest, SecondOutputIsNotPrimary)
{
	manager.map_output(2, "HDMI-A-1", {2560, 0, 1920, 1080});
	manager.insert_window(&a);

	EXPECT_EQ(manager.current().primary_output()->id, 1u);
	EXPECT_EQ(manager.current().outputs.size(), 2u);
	EXPECT_LT(manager.find_window(&a)->geometry.x, 2560);

	/* losing the primary output promotes the next one */
	manager.unmap_output(1);
	EXPECT_EQ(manager.current().primary_output()->id, 2u);
	EXPECT_GE(manager.find_window(&a)->geometry.x, 2560);
}

TEST_F(WorkspacesTest, WindowsKeepGeometryWithoutOutput)
{
	manager.insert_window(&a);
	struct wlr_box geo = manager.find_window(&a)->geometry;
	manager.unmap_output(1);

	EXPECT_EQ(manager.current().primary_output(), nullptr);
	EXPECT_TRUE(manager.find_window(&a)->geometry == geo);
	EXPECT_FALSE(manager.set_fullscreen(&a, true));
}
