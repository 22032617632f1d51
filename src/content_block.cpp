/* content_block.cpp - splits a normalized tree into content blocks.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "content_block.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace {
struct block_group {
	std::vector<size_t> nodes;
	bool inline_run{false};
};

// Elements that are kept whole even when they contain other block-level elements.
constexpr bool is_atomic_block(std::string_view tag_name) noexcept {
	constexpr std::array atomic_blocks = {
		"p",
		"pre",
		"table",
		"blockquote",
		"figure",
		"dl",
		"address",
		"h1",
		"h2",
		"h3",
		"h4",
		"h5",
		"h6",
	};
	return std::find(atomic_blocks.begin(), atomic_blocks.end(), tag_name) != atomic_blocks.end();
}

bool has_block_child(const dom_tree& tree, size_t index) {
	const auto& children = tree.node(index).children;
	return std::any_of(children.begin(), children.end(), [&tree](size_t child) {
		const auto& node = tree.node(child);
		return node.is_element() && is_block_element(node.tag);
	});
}

void append_block_text(const dom_tree& tree, size_t index, std::string& out) {
	const auto& node = tree.node(index);
	if (node.is_text()) {
		out += node.text;
		return;
	}
	if (!node.is_element()) {
		return;
	}
	if (node.tag == "br") {
		out += ' ';
		return;
	}
	const bool block = is_block_element(node.tag);
	if (block) {
		out += ' ';
	}
	for (const size_t child : node.children) {
		append_block_text(tree, child, out);
	}
	if (block) {
		out += ' ';
	}
}

void collect_groups(const dom_tree& tree, size_t index, std::vector<block_group>& groups) {
	const auto& node = tree.node(index);
	if (is_atomic_block(node.tag) || !has_block_child(tree, index)) {
		groups.push_back({{index}, false});
		return;
	}
	std::vector<size_t> run;
	auto flush_run = [&groups, &run]() {
		if (!run.empty()) {
			groups.push_back({run, true});
			run.clear();
		}
	};
	for (const size_t child : node.children) {
		const auto& child_node = tree.node(child);
		if (child_node.is_element() && is_block_element(child_node.tag)) {
			flush_run();
			collect_groups(tree, child, groups);
		} else if (child_node.is_element() || child_node.is_text()) {
			run.push_back(child);
		}
	}
	flush_run();
}

std::string group_text(const dom_tree& tree, const block_group& group) {
	std::string text;
	for (const size_t index : group.nodes) {
		append_block_text(tree, index, text);
	}
	return text;
}

bool is_heading_group(const dom_tree& tree, const block_group& group) {
	return !group.inline_run && group.nodes.size() == 1 && is_heading_element(tree.node(group.nodes.front()).tag);
}

// A list item keeps its list so that it still renders as an item once reparsed on its own.
std::string wrap_list_item(const dom_tree& tree, size_t item, const std::string& item_html) {
	const size_t list = tree.node(item).parent;
	if (list == dom_tree::npos || tree.node(list).tag != "ol") {
		return "<ul>" + item_html + "</ul>";
	}
	long number = ordered_list_start(tree.node(list));
	for (const size_t sibling : tree.node(list).children) {
		if (sibling == item) {
			break;
		}
		const auto& node = tree.node(sibling);
		if (node.is_element() && node.tag == "li") {
			++number;
		}
	}
	return "<ol start=\"" + std::to_string(number) + "\">" + item_html + "</ol>";
}

std::string group_html(const dom_tree& tree, const block_group& group) {
	if (!group.inline_run) {
		const size_t index = group.nodes.front();
		std::string html = tree.outer_html(index);
		return tree.node(index).tag == "li" ? wrap_list_item(tree, index, html) : html;
	}
	std::string inner;
	for (const size_t index : group.nodes) {
		inner += tree.outer_html(index);
	}
	const size_t parent = tree.node(group.nodes.front()).parent;
	if (parent != dom_tree::npos && tree.node(parent).tag == "li") {
		return wrap_list_item(tree, parent, "<li>" + inner + "</li>");
	}
	return "<p>" + inner + "</p>";
}

content_block build_block(const dom_tree& tree, size_t root, const std::vector<const block_group*>& parts) {
	content_block block;
	std::string text;
	for (const auto* part : parts) {
		if (!block.html.empty()) {
			block.html += '\n';
		}
		block.html += group_html(tree, *part);
		text += ' ';
		text += group_text(tree, *part);
		for (const size_t index : part->nodes) {
			block.nodes.push_back(index);
			for (const size_t descendant : tree.descendants(index)) {
				const auto& node = tree.node(descendant);
				if (node.is_element() && node.tag == "a") {
					block.link_text_length += utf8_length(block_text(tree, descendant));
				}
			}
		}
	}
	const block_group& principal_group = *parts.back();
	const size_t principal = principal_group.inline_run ? tree.node(principal_group.nodes.front()).parent : principal_group.nodes.front();
	block.tag = principal != dom_tree::npos ? tree.node(principal).tag : std::string{};
	for (size_t current = principal; current != dom_tree::npos && current != root; current = tree.node(current).parent) {
		const auto& node = tree.node(current);
		for (const auto* name : {"class", "id"}) {
			const auto value = node.attribute(name);
			if (value) {
				block.class_id_context += to_lower_ascii(*value);
				block.class_id_context += ' ';
			}
		}
	}
	block.text = trim_string(collapse_whitespace(text));
	block.text_length = utf8_length(block.text);
	block.html_length = utf8_length(block.html);
	block.word_count = count_words(block.text);
	return block;
}
} // namespace

std::string block_text(const dom_tree& tree, size_t index) {
	std::string out;
	append_block_text(tree, index, out);
	return trim_string(collapse_whitespace(out));
}

std::vector<content_block> collect_content_blocks(const dom_tree& tree, size_t root) {
	std::vector<content_block> blocks;
	if (root == dom_tree::npos || root >= tree.size()) {
		return blocks;
	}
	std::vector<block_group> groups;
	collect_groups(tree, root, groups);
	groups.erase(std::remove_if(groups.begin(), groups.end(), [&tree](const block_group& group) {
		return trim_string(collapse_whitespace(group_text(tree, group))).empty();
	}), groups.end());
	for (size_t i = 0; i < groups.size(); ++i) {
		if (is_heading_group(tree, groups[i]) && i + 1 < groups.size() && !is_heading_group(tree, groups[i + 1])) {
			blocks.push_back(build_block(tree, root, {&groups[i], &groups[i + 1]}));
			++i;
		} else {
			blocks.push_back(build_block(tree, root, {&groups[i]}));
		}
	}
	return blocks;
}
