/* SPDX-License-Identifier: GPL-2.0-only */
#ifndef STACKWC_XML_H
#define STACKWC_XML_H

#include <libxml/tree.h>
#include "common/str.h"

/*
 * Iterate over the element children of @parent. @key is set to the
 * element name and @content to its text when the child is a leaf
 * (an empty string otherwise).
 */
#define SWC_XML_FOR_EACH(parent, child, key, content)                   \
	for ((child) = swc_xml_first_element(parent);                   \
		(child) && ((key) = (const char *)(child)->name,        \
			(content) = swc_xml_leaf_content(child), true); \
		(child) = swc_xml_next_element(child))

/* Same, for loops that only look at the child node */
#define SWC_XML_FOR_EACH_ELEMENT(parent, child)                         \
	for ((child) = swc_xml_first_element(parent); (child);          \
		(child) = swc_xml_next_element(child))

xmlNode *swc_xml_first_element(xmlNode *parent);
xmlNode *swc_xml_next_element(xmlNode *node);

/* Text of a leaf element, "" for nodes with element children */
const char *swc_xml_leaf_content(xmlNode *node);

bool swc_xml_node_is_leaf(xmlNode *node);

/* Element name matches @name, case insensitive */
bool swc_xml_node_is(xmlNode *node, const char *name);

/*
 * Turn every attribute into a leading child element, recursively, so
 * that <border gap="2"/> reads the same as <border><gap>2</gap></border>.
 */
void swc_xml_expand_attributes(xmlNode *node);

/*
 * Look up the leaf child @key (case insensitive). The getters leave
 * @value untouched and return false when it is missing or malformed.
 */
bool swc_xml_get_string(xmlNode *node, const char *key, swc_str &value);
bool swc_xml_get_int(xmlNode *node, const char *key, int *value);
bool swc_xml_get_float(xmlNode *node, const char *key, float *value);
bool swc_xml_get_bool(xmlNode *node, const char *key, bool *value);

/**
 * nodename() - dotted path from @node up to the document root
 * @node: element
 * @buf: output buffer
 * @len: size of @buf
 *
 * <a><b><c>x</c></b></a> gives "c.b.a" for <c>.
 */
char *nodename(xmlNode *node, char *buf, int len);

#endif /* STACKWC_XML_H */
