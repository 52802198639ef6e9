// SPDX-License-Identifier: GPL-2.0-only
#include "common/xml.h"
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <vector>
#include "common/parse-bool.h"

static xmlNode *
skip_non_elements(xmlNode *node)
{
	while (node && node->type != XML_ELEMENT_NODE) {
		node = node->next;
	}
	return node;
}

xmlNode *
swc_xml_first_element(xmlNode *parent)
{
	return parent ? skip_non_elements(parent->children) : NULL;
}

xmlNode *
swc_xml_next_element(xmlNode *node)
{
	return skip_non_elements(node->next);
}

bool
swc_xml_node_is_leaf(xmlNode *node)
{
	return !swc_xml_first_element(node);
}

bool
swc_xml_node_is(xmlNode *node, const char *name)
{
	return !strcasecmp((const char *)node->name, name);
}

const char *
swc_xml_leaf_content(xmlNode *node)
{
	if (!swc_xml_node_is_leaf(node)) {
		return "";
	}
	for (xmlNode *n = node->children; n; n = n->next) {
		if ((n->type == XML_TEXT_NODE || n->type == XML_CDATA_SECTION_NODE)
				&& n->content) {
			return (const char *)n->content;
		}
	}
	return "";
}

void
swc_xml_expand_attributes(xmlNode *node)
{
	if (!node || node->type != XML_ELEMENT_NODE) {
		return;
	}

	std::vector<xmlAttr *> attrs;
	for (xmlAttr *attr = node->properties; attr; attr = attr->next) {
		attrs.push_back(attr);
	}

	/* Insert in reverse so that the children keep attribute order */
	for (auto it = attrs.rbegin(); it != attrs.rend(); ++it) {
		xmlAttr *attr = *it;
		xmlChar *value = xmlNodeGetContent((xmlNode *)attr);
		xmlNode *child = xmlNewDocNode(node->doc, NULL, attr->name,
			NULL);
		xmlNodeAddContent(child, value ? value : (const xmlChar *)"");
		xmlFree(value);

		xmlNode *first = node->children;
		if (first) {
			xmlAddPrevSibling(first, child);
		} else {
			xmlAddChild(node, child);
		}
		xmlRemoveProp(attr);
	}

	for (xmlNode *child = swc_xml_first_element(node); child;
			child = swc_xml_next_element(child)) {
		swc_xml_expand_attributes(child);
	}
}

static xmlNode *
find_leaf(xmlNode *node, const char *key)
{
	xmlNode *child;
	SWC_XML_FOR_EACH_ELEMENT(node, child) {
		if (swc_xml_node_is(child, key) && swc_xml_node_is_leaf(child)) {
			return child;
		}
	}
	return NULL;
}

bool
swc_xml_get_string(xmlNode *node, const char *key, swc_str &value)
{
	xmlNode *leaf = find_leaf(node, key);
	if (!leaf) {
		return false;
	}
	value = swc_str(swc_xml_leaf_content(leaf));
	return true;
}

bool
swc_xml_get_int(xmlNode *node, const char *key, int *value)
{
	swc_str str;
	if (!swc_xml_get_string(node, key, str) || !str) {
		return false;
	}
	char *end = NULL;
	long l = strtol(str.c(), &end, 10);
	if (*end) {
		return false;
	}
	*value = (int)l;
	return true;
}

bool
swc_xml_get_float(xmlNode *node, const char *key, float *value)
{
	swc_str str;
	if (!swc_xml_get_string(node, key, str) || !str) {
		return false;
	}
	char *end = NULL;
	float f = strtof(str.c(), &end);
	if (*end) {
		return false;
	}
	*value = f;
	return true;
}

bool
swc_xml_get_bool(xmlNode *node, const char *key, bool *value)
{
	swc_str str;
	if (!swc_xml_get_string(node, key, str)) {
		return false;
	}
	int ret = parse_bool(str.c(), -1);
	if (ret < 0) {
		return false;
	}
	*value = ret;
	return true;
}

char *
nodename(xmlNode *node, char *buf, int len)
{
	if (!node || !node->name || len <= 0) {
		return NULL;
	}

	/* Write "name.parent.grandparent..." */
	char *p = buf;
	int remaining = len - 1;
	for (xmlNode *n = node; n && n->type == XML_ELEMENT_NODE;
			n = n->parent) {
		const char *name = (const char *)n->name;
		int needed = strlen(name) + (p != buf);
		if (needed > remaining) {
			break;
		}
		if (p != buf) {
			*p++ = '.';
		}
		memcpy(p, name, strlen(name));
		p += strlen(name);
		remaining -= needed;
	}
	*p = '\0';
	return buf;
}
