// SPDX-License-Identifier: GPL-2.0-only
#include <gtest/gtest.h>
#include <libxml/parser.h>
#include <stdlib.h>
#include <string>
#include <vector>
#include "common/alg.h"
#include "common/buf.h"
#include "common/edge.h"
#include "common/parse-bool.h"
#include "common/string-helpers.h"
#include "common/xml.h"

TEST(BufTest, ExpandTilde)
{
	setenv("HOME", "/home/user", 1);
	EXPECT_STREQ(buf_expand_tilde("~/bin/foot").c(),
		"/home/user/bin/foot");
	EXPECT_STREQ(buf_expand_tilde("foot").c(), "foot");
}

TEST(BufTest, ExpandShellVariables)
{
	setenv("STACKWC_TEST_VAR", "value", 1);
	unsetenv("STACKWC_TEST_UNSET");

	EXPECT_STREQ(buf_expand_shell_variables("a $STACKWC_TEST_VAR b").c(),
		"a value b");
	EXPECT_STREQ(buf_expand_shell_variables("${STACKWC_TEST_VAR}x").c(),
		"valuex");
	EXPECT_STREQ(buf_expand_shell_variables("[$STACKWC_TEST_UNSET]").c(),
		"[]");
	EXPECT_STREQ(buf_expand_shell_variables("100 $ each").c(), "100 $ each");
	EXPECT_STREQ(buf_expand_shell_variables("${unterminated").c(),
		"${unterminated");
}

TEST(BufTest, HexColor)
{
	float rgba[4] = {0, 0, 0, 0};
	ASSERT_TRUE(hex_color_parse("#ff8000", rgba));
	EXPECT_FLOAT_EQ(rgba[0], 1.0f);
	EXPECT_FLOAT_EQ(rgba[1], 128 / 255.0f);
	EXPECT_FLOAT_EQ(rgba[2], 0.0f);
	EXPECT_FLOAT_EQ(rgba[3], 1.0f);

	/* alpha is pre-multiplied */
	ASSERT_TRUE(hex_color_parse("#FFFFFF80", rgba));
	EXPECT_FLOAT_EQ(rgba[3], 128 / 255.0f);
	EXPECT_FLOAT_EQ(rgba[0], 128 / 255.0f);
}

TEST(BufTest, MalformedHexColorIsRejected)
{
	float rgba[4] = {0.5f, 0.5f, 0.5f, 0.5f};
	EXPECT_FALSE(hex_color_parse("ff8000", rgba));
	EXPECT_FALSE(hex_color_parse("#ff80", rgba));
	EXPECT_FALSE(hex_color_parse("#gg8000", rgba));
	EXPECT_FALSE(hex_color_parse(nullptr, rgba));
	EXPECT_FLOAT_EQ(rgba[0], 0.5f);
}

TEST(StrTest, PrintfAndBool)
{
	swc_str s = strdup_printf("C-A-F%d", 12);
	EXPECT_STREQ(s.c(), "C-A-F12");
	EXPECT_TRUE((bool)s);
	EXPECT_FALSE((bool)swc_str());
	EXPECT_FALSE((bool)swc_str((const char *)nullptr));
}

TEST(StringHelpersTest, TruncateAndPrefix)
{
	char buf[] = "number.desktops.stackwc_config";
	string_truncate_at_pattern(buf, ".stackwc_config");
	EXPECT_STREQ(buf, "number.desktops");

	EXPECT_TRUE(str_starts_with("XF86Switch_VT_1", "XF86"));
	EXPECT_FALSE(str_starts_with("foo", "foobar"));
	EXPECT_TRUE(str_space_only(" \t\n"));
	EXPECT_FALSE(str_space_only(" x "));
}

TEST(ParseBoolTest, Values)
{
	EXPECT_EQ(parse_bool("yes", -1), 1);
	EXPECT_EQ(parse_bool("On", -1), 1);
	EXPECT_EQ(parse_bool("0", -1), 0);
	EXPECT_EQ(parse_bool("FALSE", -1), 0);
	EXPECT_EQ(parse_bool("maybe", -1), -1);

	bool value = true;
	set_bool("maybe", &value);
	EXPECT_TRUE(value);
	set_bool("no", &value);
	EXPECT_FALSE(value);
}

TEST(EdgeTest, ParseAndInvert)
{
	EXPECT_EQ(swc_edge_parse("Left"), SWC_EDGE_LEFT);
	EXPECT_EQ(swc_edge_parse("up"), SWC_EDGE_TOP);
	EXPECT_EQ(swc_edge_parse("down"), SWC_EDGE_BOTTOM);
	EXPECT_EQ(swc_edge_parse("sideways"), SWC_EDGE_NONE);
	EXPECT_EQ(swc_edge_parse(nullptr), SWC_EDGE_NONE);

	EXPECT_EQ(swc_edge_invert(SWC_EDGE_LEFT), SWC_EDGE_RIGHT);
	EXPECT_EQ(swc_edge_invert(SWC_EDGE_TOP), SWC_EDGE_BOTTOM);
	EXPECT_TRUE(swc_edge_is_cardinal(SWC_EDGE_RIGHT));
	EXPECT_FALSE(swc_edge_is_cardinal(SWC_EDGE_TOP | SWC_EDGE_LEFT));
}

TEST(AlgTest, RemoveAndContains)
{
	std::vector<int> v = {1, 2, 3, 2};
	EXPECT_TRUE(swc::contains(v, 2));
	swc::remove(v, 2);
	EXPECT_FALSE(swc::contains(v, 2));
	EXPECT_EQ(v.size(), 2u);
}

TEST(XmlTest, ElementLoopSkipsTextAndComments)
{
	static const char doc[] =
		"<keybind>\n"
		"  <!-- comment -->\n"
		"  <Action name=\"Close\"/>\n"
		"  text\n"
		"  <action name=\"Spawn\"><command>foot</command></action>\n"
		"</keybind>";
	xmlDoc *d = xmlReadMemory(doc, sizeof(doc) - 1, NULL, NULL, 0);
	ASSERT_NE(d, nullptr);
	xmlNode *root = xmlDocGetRootElement(d);
	swc_xml_expand_attributes(root);

	std::vector<std::string> names;
	xmlNode *child;
	SWC_XML_FOR_EACH_ELEMENT(root, child) {
		EXPECT_TRUE(swc_xml_node_is(child, "action"));
		swc_str name;
		ASSERT_TRUE(swc_xml_get_string(child, "NAME", name));
		names.push_back(name.c());
	}
	ASSERT_EQ(names.size(), 2u);
	EXPECT_EQ(names[0], "Close");
	EXPECT_EQ(names[1], "Spawn");
	EXPECT_FALSE(swc_xml_node_is(root, "action"));

	xmlFreeDoc(d);
}
