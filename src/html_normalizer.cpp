/* html_normalizer.cpp - strips non-content markup and isolates the main content region.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "html_normalizer.hpp"
#include "utils.hpp"
#include <sstream>
#include <string>
#include <vector>
#include <wx/log.h>

namespace {
template <typename Predicate>
void detach_matching(dom_tree& tree, size_t root, Predicate predicate) {
	std::vector<size_t> matches;
	for (const size_t index : tree.descendants(root)) {
		if (index != root && predicate(tree.node(index))) {
			matches.push_back(index);
		}
	}
	for (const size_t index : matches) {
		tree.detach(index);
	}
}

void append_plain_text(const dom_tree& tree, size_t index, std::string& out) {
	const auto& node = tree.node(index);
	if (node.is_text()) {
		out += collapse_whitespace(remove_soft_hyphens(node.text));
		return;
	}
	if (!node.is_element()) {
		return;
	}
	if (node.tag == "br") {
		out += '\n';
		return;
	}
	const bool block = is_block_element(node.tag);
	if (block) {
		out += '\n';
	}
	for (const size_t child : node.children) {
		append_plain_text(tree, child, out);
	}
	if (block) {
		out += '\n';
	}
}
} // namespace

normalized_page html_normalizer::normalize(std::string_view html) const {
	normalized_page page;
	page.tree = dom_tree::parse(convert_to_utf8(std::string{html}));
	if (page.tree.empty()) {
		wxLogDebug("Blank document, nothing to normalize");
		return page;
	}
	clean(page.tree);
	page.content_root = select_main_content(page.tree);
	return page;
}

std::string html_normalizer::extract_text(std::string_view html) const {
	dom_tree tree = dom_tree::parse(convert_to_utf8(std::string{html}));
	if (tree.empty()) {
		return {};
	}
	clean(tree);
	size_t body = tree.find_first_element(tree.root(), "body");
	if (body == dom_tree::npos) {
		body = tree.root();
	}
	unwrap_tags(tree, body);
	tree.merge_adjacent_text(body);
	std::string raw;
	append_plain_text(tree, body, raw);
	std::istringstream iss(raw);
	std::ostringstream oss;
	std::string line;
	bool first = true;
	while (std::getline(iss, line)) {
		line = trim_string(collapse_whitespace(line));
		if (line.empty()) {
			continue;
		}
		if (!first) {
			oss << '\n';
		}
		oss << line;
		first = false;
	}
	return oss.str();
}

void html_normalizer::clean(dom_tree& tree) const {
	if (tree.empty()) {
		return;
	}
	remove_comments(tree);
	remove_tags(tree);
	remove_hidden(tree);
}

void html_normalizer::remove_comments(dom_tree& tree) {
	detach_matching(tree, tree.root(), [](const dom_node& node) {
		return node.type == dom_node_type::comment;
	});
}

void html_normalizer::remove_tags(dom_tree& tree) const {
	detach_matching(tree, tree.root(), [this](const dom_node& node) {
		return node.is_element() && policy.is_removal_tag(node.tag);
	});
}

void html_normalizer::remove_hidden(dom_tree& tree) {
	detach_matching(tree, tree.root(), [](const dom_node& node) {
		return cleaning_policy::is_hidden(node);
	});
}

void html_normalizer::unwrap_tags(dom_tree& tree, size_t root) const {
	std::vector<size_t> wrappers;
	for (const size_t index : tree.descendants(root)) {
		const auto& node = tree.node(index);
		if (index != root && node.is_element() && policy.is_unwrap_tag(node.tag)) {
			wrappers.push_back(index);
		}
	}
	for (const size_t index : wrappers) {
		tree.unwrap(index);
	}
}

size_t html_normalizer::select_main_content(dom_tree& tree) const {
	const size_t root = tree.root();
	if (root == dom_tree::npos) {
		return dom_tree::npos;
	}
	for (const auto& selector : policy.main_content_selectors) {
		const size_t match = tree.find_first(root, [&selector](const dom_node& node) {
			return matches_selector(node, selector);
		});
		if (match != dom_tree::npos) {
			wxLogDebug("Main content selected by '%s'", selector_to_string(selector));
			return match;
		}
	}
	size_t body = tree.find_first_element(root, "body");
	if (body == dom_tree::npos) {
		body = root;
	}
	for (const auto& selector : policy.fallback_removal_selectors) {
		detach_matching(tree, body, [&selector](const dom_node& node) {
			return matches_selector(node, selector);
		});
	}
	wxLogDebug("No main content candidate matched, using the cleaned body");
	return body;
}
