/* dom_tree.cpp - builds the DOM arena from a lexbor parse and serializes it back to markup.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "dom_tree.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <lexbor/dom/interfaces/attr.h>
#include <lexbor/dom/interfaces/element.h>
#include <lexbor/html/html.h>
#include <lexbor/html/parser.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <wx/log.h>
#include <wx/string.h>

namespace {
struct document_deleter {
	void operator()(lxb_html_document_t* doc) const noexcept {
		if (doc) {
			lxb_html_document_destroy(doc);
		}
	}
};
using document_ptr = std::unique_ptr<lxb_html_document_t, document_deleter>;

std::string_view get_tag_name(lxb_dom_element_t* element) noexcept {
	if (!element) {
		return {};
	}
	size_t len;
	const auto* name = lxb_dom_element_qualified_name(element, &len);
	return name ? std::string_view{reinterpret_cast<const char*>(name), len} : std::string_view{};
}

std::string get_node_data(lxb_dom_node_t* node) {
	size_t length = 0;
	const auto* data = lxb_dom_node_text_content(node, &length);
	if (!data || length == 0) {
		return {};
	}
	return std::string{reinterpret_cast<const char*>(data), length};
}

void import_node(lxb_dom_node_t* node, size_t parent, dom_tree& tree) {
	switch (node->type) {
		case LXB_DOM_NODE_TYPE_ELEMENT: {
			auto* element = lxb_dom_interface_element(node);
			std::vector<std::pair<std::string, std::string>> attributes;
			for (auto* attr = lxb_dom_element_first_attribute(element); attr; attr = lxb_dom_element_next_attribute(attr)) {
				size_t name_len = 0;
				const lxb_char_t* name = lxb_dom_attr_qualified_name(attr, &name_len);
				if (!name || name_len == 0) {
					continue;
				}
				size_t value_len = 0;
				const lxb_char_t* value = lxb_dom_attr_value(attr, &value_len);
				attributes.emplace_back(std::string(reinterpret_cast<const char*>(name), name_len), value ? std::string(reinterpret_cast<const char*>(value), value_len) : std::string{});
			}
			const size_t index = tree.append_element(parent, std::string(get_tag_name(element)), std::move(attributes));
			for (auto* child = node->first_child; child; child = child->next) {
				import_node(child, index, tree);
			}
			break;
		}
		case LXB_DOM_NODE_TYPE_TEXT:
			if (parent != dom_tree::npos) {
				tree.append_text(parent, get_node_data(node));
			}
			break;
		case LXB_DOM_NODE_TYPE_COMMENT:
			if (parent != dom_tree::npos) {
				tree.append_comment(parent, get_node_data(node));
			}
			break;
		default:
			break;
	}
}

void escape_into(std::string_view text, std::string& out, bool attribute) {
	for (const char ch : text) {
		switch (ch) {
			case '&':
				out += "&amp;";
				break;
			case '<':
				out += "&lt;";
				break;
			case '>':
				out += "&gt;";
				break;
			case '"':
				if (attribute) {
					out += "&quot;";
				} else {
					out += ch;
				}
				break;
			default:
				out += ch;
				break;
		}
	}
}
} // namespace

std::optional<std::string_view> dom_node::attribute(std::string_view name) const noexcept {
	for (const auto& [key, value] : attributes) {
		if (key == name) {
			return std::string_view{value};
		}
	}
	return std::nullopt;
}

dom_tree dom_tree::parse(std::string_view html) {
	dom_tree tree;
	if (trim_string(std::string(html)).empty()) {
		return tree;
	}
	const document_ptr doc(lxb_html_document_create());
	if (!doc) {
		throw std::runtime_error("Failed to create Lexbor HTML document");
	}
	const auto status = lxb_html_document_parse(doc.get(), reinterpret_cast<const lxb_char_t*>(html.data()), html.length());
	if (status != LXB_STATUS_OK) {
		wxLogWarning("lexbor could not parse document (status %d)", static_cast<int>(status));
		return tree;
	}
	for (auto* child = lxb_dom_interface_node(doc.get())->first_child; child; child = child->next) {
		if (child->type == LXB_DOM_NODE_TYPE_ELEMENT) {
			import_node(child, npos, tree);
			break;
		}
	}
	return tree;
}

size_t dom_tree::append_node(size_t parent, dom_node node) {
	const size_t index = nodes.size();
	node.parent = parent;
	nodes.push_back(std::move(node));
	if (parent != npos) {
		nodes.at(parent).children.push_back(index);
	}
	return index;
}

size_t dom_tree::append_element(size_t parent, std::string tag, std::vector<std::pair<std::string, std::string>> attributes) {
	dom_node node;
	node.type = dom_node_type::element;
	node.tag = std::move(tag);
	node.attributes = std::move(attributes);
	return append_node(parent, std::move(node));
}

size_t dom_tree::append_text(size_t parent, std::string text) {
	dom_node node;
	node.type = dom_node_type::text;
	node.text = std::move(text);
	return append_node(parent, std::move(node));
}

size_t dom_tree::append_comment(size_t parent, std::string text) {
	dom_node node;
	node.type = dom_node_type::comment;
	node.text = std::move(text);
	return append_node(parent, std::move(node));
}

void dom_tree::detach(size_t index) {
	auto& node = nodes.at(index);
	if (node.parent == npos) {
		return;
	}
	auto& siblings = nodes.at(node.parent).children;
	siblings.erase(std::remove(siblings.begin(), siblings.end(), index), siblings.end());
	node.parent = npos;
}

void dom_tree::unwrap(size_t index) {
	auto& node = nodes.at(index);
	const size_t parent = node.parent;
	if (parent == npos) {
		return;
	}
	std::vector<size_t> moved = std::move(node.children);
	node.children.clear();
	node.parent = npos;
	for (const size_t child : moved) {
		nodes[child].parent = parent;
	}
	auto& siblings = nodes.at(parent).children;
	const auto pos = std::find(siblings.begin(), siblings.end(), index);
	if (pos == siblings.end()) {
		return;
	}
	const auto offset = pos - siblings.begin();
	siblings.erase(pos);
	siblings.insert(siblings.begin() + offset, moved.begin(), moved.end());
}

void dom_tree::merge_adjacent_text(size_t index) {
	for (const size_t current : descendants(index)) {
		if (!nodes[current].is_element()) {
			continue;
		}
		std::vector<size_t> merged;
		merged.reserve(nodes[current].children.size());
		for (const size_t child : nodes[current].children) {
			if (nodes[child].is_text() && !merged.empty() && nodes[merged.back()].is_text()) {
				nodes[merged.back()].text += nodes[child].text;
				nodes[child].parent = npos;
				continue;
			}
			merged.push_back(child);
		}
		nodes[current].children = std::move(merged);
	}
}

std::vector<size_t> dom_tree::descendants(size_t index) const {
	std::vector<size_t> result;
	if (index >= nodes.size()) {
		return result;
	}
	std::vector<size_t> stack{index};
	while (!stack.empty()) {
		const size_t current = stack.back();
		stack.pop_back();
		result.push_back(current);
		const auto& children = nodes[current].children;
		for (auto it = children.rbegin(); it != children.rend(); ++it) {
			stack.push_back(*it);
		}
	}
	return result;
}

size_t dom_tree::find_first(size_t index, const std::function<bool(const dom_node&)>& predicate) const {
	for (const size_t current : descendants(index)) {
		if (predicate(nodes[current])) {
			return current;
		}
	}
	return npos;
}

size_t dom_tree::find_first_element(size_t index, std::string_view tag) const {
	return find_first(index, [tag](const dom_node& node) {
		return node.is_element() && node.tag == tag;
	});
}

std::string dom_tree::text_content(size_t index) const {
	std::string out;
	append_text_content(index, out);
	return out;
}

void dom_tree::append_text_content(size_t index, std::string& out) const {
	const auto& node = nodes.at(index);
	if (node.is_text()) {
		out += node.text;
		return;
	}
	if (!node.is_element()) {
		return;
	}
	for (const size_t child : node.children) {
		append_text_content(child, out);
	}
}

std::string dom_tree::outer_html(size_t index) const {
	std::string out;
	serialize(index, out);
	return out;
}

void dom_tree::serialize(size_t index, std::string& out) const {
	const auto& node = nodes.at(index);
	switch (node.type) {
		case dom_node_type::text:
			escape_into(node.text, out, false);
			return;
		case dom_node_type::comment:
			out += "<!--";
			out += node.text;
			out += "-->";
			return;
		case dom_node_type::element:
			break;
	}
	out += '<';
	out += node.tag;
	for (const auto& [name, value] : node.attributes) {
		out += ' ';
		out += name;
		out += "=\"";
		escape_into(value, out, true);
		out += '"';
	}
	out += '>';
	if (is_void_element(node.tag)) {
		return;
	}
	for (const size_t child : node.children) {
		serialize(child, out);
	}
	out += "</";
	out += node.tag;
	out += '>';
}

bool is_void_element(std::string_view tag) noexcept {
	constexpr std::array void_elements = {
		"area",
		"base",
		"br",
		"col",
		"embed",
		"hr",
		"img",
		"input",
		"link",
		"meta",
		"source",
		"track",
		"wbr",
	};
	return std::find(void_elements.begin(), void_elements.end(), tag) != void_elements.end();
}

bool is_block_element(std::string_view tag_name) noexcept {
	if (tag_name.empty()) {
		return false;
	}
	constexpr std::array block_elements = {
		"html",
		"body",
		"div",
		"p",
		"pre",
		"h1",
		"h2",
		"h3",
		"h4",
		"h5",
		"h6",
		"blockquote",
		"ul",
		"ol",
		"li",
		"dl",
		"dt",
		"dd",
		"section",
		"article",
		"header",
		"footer",
		"nav",
		"aside",
		"main",
		"figure",
		"figcaption",
		"address",
		"details",
		"summary",
		"hr",
		"table",
		"caption",
		"thead",
		"tbody",
		"tfoot",
		"tr",
		"td",
		"th",
	};
	return std::find(block_elements.begin(), block_elements.end(), tag_name) != block_elements.end();
}

bool is_heading_element(std::string_view tag_name) noexcept {
	return heading_level(tag_name) > 0;
}

int heading_level(std::string_view tag_name) noexcept {
	if (tag_name.length() == 2 && tag_name[0] == 'h' && tag_name[1] >= '1' && tag_name[1] <= '6') {
		return tag_name[1] - '0';
	}
	return 0;
}

long ordered_list_start(const dom_node& list) {
	const auto start = list.attribute("start");
	long value = 0;
	if (start && wxString::FromUTF8(start->data(), start->size()).Trim(true).Trim(false).ToLong(&value)) {
		return value;
	}
	return 1;
}
