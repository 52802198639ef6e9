// SPDX-License-Identifier: GPL-2.0-only
#include <gtest/gtest.h>
#include <wlr/types/wlr_keyboard.h>
#include <xkbcommon/xkbcommon-keysyms.h>
#include "config/keybind.h"
#include "config/rcxml.h"

class ConfigTest : public ::testing::Test
{
protected:
	void TearDown() override { rcxml_finish(); }
};

static keybind *
find_keybind(uint32_t modifiers, xkb_keysym_t sym)
{
	for (auto &k : rc.keybinds) {
		if (keybind_matches(k, modifiers, sym)) {
			return &k;
		}
	}
	return nullptr;
}

TEST_F(ConfigTest, Defaults)
{
	rcxml_parse_string(nullptr);

	EXPECT_EQ(rc.workspace_count, 4);
	EXPECT_EQ(rc.border_thickness, 2);
	EXPECT_EQ(rc.gap, 2);
	EXPECT_EQ(rc.repeat_rate, 25);
	EXPECT_EQ(rc.repeat_delay, 600);
	EXPECT_EQ(rc.mouse_modifier, (uint32_t)WLR_MODIFIER_LOGO);
	EXPECT_FALSE(rc.kb_layout);
	EXPECT_TRUE(rc.outputs.empty());
	EXPECT_TRUE(rc.autostart.empty());
	EXPECT_FLOAT_EQ(rc.active_border_color[0], 0x8b / 255.0f);
	EXPECT_FLOAT_EQ(rc.inactive_border_color[0], 0x2a / 255.0f);

	keybind *close = find_keybind(WLR_MODIFIER_LOGO, XKB_KEY_c);
	ASSERT_NE(close, nullptr);
	ASSERT_EQ(close->actions.size(), 1u);
	EXPECT_EQ(close->actions[0].type, ACTION_TYPE_CLOSE);

	keybind *exit = find_keybind(WLR_MODIFIER_LOGO | WLR_MODIFIER_SHIFT,
		XKB_KEY_Return);
	ASSERT_NE(exit, nullptr);
	EXPECT_EQ(exit->actions[0].type, ACTION_TYPE_EXIT);

	keybind *go = find_keybind(WLR_MODIFIER_LOGO, XKB_KEY_3);
	ASSERT_NE(go, nullptr);
	EXPECT_EQ(go->actions[0].type, ACTION_TYPE_GO_TO_DESKTOP);
	EXPECT_EQ(go->actions[0].get_int("to", -1), 3);

	keybind *focus = find_keybind(WLR_MODIFIER_LOGO, XKB_KEY_h);
	ASSERT_NE(focus, nullptr);
	EXPECT_EQ(focus->actions[0].get_int("direction", 0), SWC_EDGE_LEFT);

	keybind *vt = find_keybind(WLR_MODIFIER_CTRL | WLR_MODIFIER_ALT,
		XKB_KEY_F7);
	ASSERT_NE(vt, nullptr);
	EXPECT_EQ(vt->actions[0].type, ACTION_TYPE_VT_SWITCH);
	EXPECT_EQ(vt->actions[0].get_int("to", -1), 7);

	keybind *execute = find_keybind(WLR_MODIFIER_LOGO, XKB_KEY_q);
	ASSERT_NE(execute, nullptr);
	EXPECT_STREQ(execute->actions[0].get_str("command", "").c(), "foot");
}

TEST_F(ConfigTest, FullFile)
{
	rcxml_parse_string(
		"<stackwc_config>"
		"  <desktops number=\"6\"/>"
		"  <border thickness=\"3\" gap=\"5\" activeColor=\"#ff0000\""
		"    inactiveColor=\"#00ff0080\"/>"
		"  <keyboard layout=\"de\" repeatRate=\"40\" repeatDelay=\"300\">"
		"    <keybind key=\"W-Return\">"
		"      <action name=\"Execute\" command=\"alacritty\"/>"
		"    </keybind>"
		"  </keyboard>"
		"  <mouse modifier=\"A\"/>"
		"  <outputs>"
		"    <output name=\"DP-1\" width=\"2560\" height=\"1440\""
		"      refresh=\"144\" scale=\"1.5\" x=\"0\" y=\"0\"/>"
		"    <output name=\"HDMI-A-1\" enabled=\"no\"/>"
		"  </outputs>"
		"  <autostart>"
		"    <command>waybar</command>"
		"    <command>mako</command>"
		"  </autostart>"
		"</stackwc_config>");

	EXPECT_EQ(rc.workspace_count, 6);
	EXPECT_EQ(rc.border_thickness, 3);
	EXPECT_EQ(rc.gap, 5);
	EXPECT_FLOAT_EQ(rc.active_border_color[0], 1.0f);
	EXPECT_FLOAT_EQ(rc.active_border_color[1], 0.0f);
	EXPECT_FLOAT_EQ(rc.inactive_border_color[3], 128 / 255.0f);
	EXPECT_STREQ(rc.kb_layout.c(), "de");
	EXPECT_EQ(rc.repeat_rate, 40);
	EXPECT_EQ(rc.repeat_delay, 300);
	EXPECT_EQ(rc.mouse_modifier, (uint32_t)WLR_MODIFIER_ALT);

	/* user bindings replace the defaults */
	ASSERT_EQ(rc.keybinds.size(), 1u);
	keybind *term = find_keybind(WLR_MODIFIER_LOGO, XKB_KEY_Return);
	ASSERT_NE(term, nullptr);
	EXPECT_STREQ(term->actions[0].get_str("command", "").c(), "alacritty");

	ASSERT_EQ(rc.outputs.size(), 2u);
	const output_config *dp = rcxml_output_config("DP-1");
	ASSERT_NE(dp, nullptr);
	EXPECT_TRUE(dp->enabled);
	EXPECT_EQ(dp->width, 2560);
	EXPECT_EQ(dp->height, 1440);
	EXPECT_EQ(dp->refresh, 144);
	EXPECT_FLOAT_EQ(dp->scale, 1.5f);
	EXPECT_TRUE(dp->has_position);

	const output_config *hdmi = rcxml_output_config("HDMI-A-1");
	ASSERT_NE(hdmi, nullptr);
	EXPECT_FALSE(hdmi->enabled);
	EXPECT_FALSE(hdmi->has_position);
	EXPECT_EQ(hdmi->width, 0);
	EXPECT_EQ(rcxml_output_config("eDP-1"), nullptr);

	ASSERT_EQ(rc.autostart.size(), 2u);
	EXPECT_STREQ(rc.autostart[0].c(), "waybar");
	EXPECT_STREQ(rc.autostart[1].c(), "mako");
}

TEST_F(ConfigTest, InvalidValuesFallBackToDefaults)
{
	rcxml_parse_string(
		"<stackwc_config>"
		"  <desktops number=\"0\"/>"
		"  <border thickness=\"-1\" gap=\"x\" activeColor=\"red\"/>"
		"  <mouse modifier=\"Q\"/>"
		"  <outputs>"
		"    <output name=\"DP-1\" width=\"1920\" scale=\"0\"/>"
		"    <output enabled=\"no\"/>"
		"  </outputs>"
		"</stackwc_config>");

	EXPECT_EQ(rc.workspace_count, 4);
	EXPECT_EQ(rc.border_thickness, 2);
	EXPECT_EQ(rc.gap, 2);
	EXPECT_FLOAT_EQ(rc.active_border_color[0], 0x8b / 255.0f);
	EXPECT_EQ(rc.mouse_modifier, (uint32_t)WLR_MODIFIER_LOGO);

	/* the nameless output is dropped */
	ASSERT_EQ(rc.outputs.size(), 1u);
	/* a width without a height is not a mode */
	EXPECT_EQ(rc.outputs[0].width, 0);
	EXPECT_EQ(rc.outputs[0].height, 0);
	EXPECT_FLOAT_EQ(rc.outputs[0].scale, 0.0f);
}

TEST_F(ConfigTest, TooManyDesktops)
{
	rcxml_parse_string(
		"<stackwc_config><desktops number=\"33\"/></stackwc_config>");
	EXPECT_EQ(rc.workspace_count, 4);

	rcxml_parse_string(
		"<stackwc_config><desktops number=\"32\"/></stackwc_config>");
	EXPECT_EQ(rc.workspace_count, WORKSPACES_MAX);
}

TEST_F(ConfigTest, MalformedFileGivesDefaults)
{
	rcxml_parse_string("<stackwc_config><border thickness=\"9\">");
	EXPECT_EQ(rc.border_thickness, 2);
	EXPECT_NE(find_keybind(WLR_MODIFIER_LOGO, XKB_KEY_c), nullptr);
}

TEST_F(ConfigTest, DefaultBindingRemovedWithNone)
{
	rcxml_parse_string(
		"<stackwc_config><keyboard>"
		"  <default/>"
		"  <keybind key=\"W-c\"><action name=\"None\"/></keybind>"
		"  <keybind key=\"W-f\"><action name=\"ToggleFloating\"/></keybind>"
		"</keyboard></stackwc_config>");

	EXPECT_EQ(find_keybind(WLR_MODIFIER_LOGO, XKB_KEY_c), nullptr);
	keybind *f = find_keybind(WLR_MODIFIER_LOGO, XKB_KEY_f);
	ASSERT_NE(f, nullptr);
	ASSERT_EQ(f->actions.size(), 1u);
	EXPECT_EQ(f->actions[0].type, ACTION_TYPE_TOGGLE_FLOATING);
	EXPECT_NE(find_keybind(WLR_MODIFIER_LOGO, XKB_KEY_1), nullptr);
}

TEST_F(ConfigTest, ActionsWithoutRequiredArgumentsAreDropped)
{
	rcxml_parse_string(
		"<stackwc_config><keyboard>"
		"  <keybind key=\"W-1\"><action name=\"GoToDesktop\" to=\"0\"/></keybind>"
		"  <keybind key=\"W-h\"><action name=\"Focus\" direction=\"nowhere\"/></keybind>"
		"  <keybind key=\"W-x\"><action name=\"Bogus\"/></keybind>"
		"  <keybind key=\"W-c\"><action name=\"Close\"/></keybind>"
		"</keyboard></stackwc_config>");

	ASSERT_EQ(rc.keybinds.size(), 1u);
	EXPECT_EQ(rc.keybinds[0].actions[0].type, ACTION_TYPE_CLOSE);
}

TEST_F(ConfigTest, KeybindParsing)
{
	std::vector<keybind> keybinds;
	keybind *k = keybind_append_new(keybinds, "C-A-Delete");
	ASSERT_NE(k, nullptr);
	EXPECT_EQ(k->modifiers, (uint32_t)(WLR_MODIFIER_CTRL | WLR_MODIFIER_ALT));
	ASSERT_EQ(k->keysyms.size(), 1u);
	EXPECT_EQ(k->keysyms[0], (xkb_keysym_t)XKB_KEY_Delete);

	/* letters match regardless of case */
	k = keybind_append_new(keybinds, "W-S-q");
	ASSERT_NE(k, nullptr);
	EXPECT_TRUE(keybind_matches(*k, WLR_MODIFIER_LOGO | WLR_MODIFIER_SHIFT,
		XKB_KEY_Q));
	EXPECT_FALSE(keybind_matches(*k, WLR_MODIFIER_LOGO, XKB_KEY_q));

	EXPECT_EQ(keybind_append_new(keybinds, "W-NoSuchKey"), nullptr);
	EXPECT_EQ(keybinds.size(), 2u);

	EXPECT_EQ(parse_modifier("W"), (uint32_t)WLR_MODIFIER_LOGO);
	EXPECT_EQ(parse_modifier("Mod1"), (uint32_t)WLR_MODIFIER_ALT);
	EXPECT_EQ(parse_modifier("X"), 0u);
}

TEST_F(ConfigTest, ActionArguments)
{
	std::vector<action> actions;
	action *a = action::append_new(actions, "sendtodesktop");
	ASSERT_NE(a, nullptr);
	EXPECT_EQ(a->type, ACTION_TYPE_SEND_TO_DESKTOP);
	EXPECT_FALSE(a->is_valid());

	a->add_arg_from_xml_node("to.action", "2");
	EXPECT_TRUE(a->is_valid());
	EXPECT_EQ(a->get_int("to", -1), 2);
	/* wrong type */
	EXPECT_STREQ(a->get_str("to", "none").c(), "none");

	EXPECT_EQ(action::append_new(actions, "None"), nullptr);
	EXPECT_EQ(actions.size(), 1u);
	EXPECT_STREQ(action_name(ACTION_TYPE_MOVE_WINDOW), "MoveWindow");
}
