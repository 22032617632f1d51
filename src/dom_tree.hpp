/* dom_tree.hpp - index-addressed DOM arena built from lexbor parse trees.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

enum class dom_node_type {
	element,
	text,
	comment
};

struct dom_node {
	dom_node_type type{dom_node_type::element};
	std::string tag;
	std::string text;
	std::vector<std::pair<std::string, std::string>> attributes;
	size_t parent{static_cast<size_t>(-1)};
	std::vector<size_t> children;

	[[nodiscard]] bool is_element() const noexcept { return type == dom_node_type::element; }
	[[nodiscard]] bool is_text() const noexcept { return type == dom_node_type::text; }
	[[nodiscard]] std::optional<std::string_view> attribute(std::string_view name) const noexcept;
	[[nodiscard]] bool has_attribute(std::string_view name) const noexcept { return attribute(name).has_value(); }
};

// Nodes are never freed individually: removing a subtree only detaches it from its parent, so indices stay valid for the lifetime of the tree.
class dom_tree {
public:
	static constexpr size_t npos = static_cast<size_t>(-1);

	dom_tree() = default;
	~dom_tree() = default;
	dom_tree(const dom_tree&) = default;
	dom_tree& operator=(const dom_tree&) = default;
	dom_tree(dom_tree&&) = default;
	dom_tree& operator=(dom_tree&&) = default;

	// Parses HTML with lexbor. Returns an empty tree for blank input; throws std::runtime_error if lexbor cannot allocate a document.
	[[nodiscard]] static dom_tree parse(std::string_view html);

	[[nodiscard]] bool empty() const noexcept { return nodes.empty(); }
	[[nodiscard]] size_t root() const noexcept { return nodes.empty() ? npos : 0; }
	[[nodiscard]] size_t size() const noexcept { return nodes.size(); }
	[[nodiscard]] const dom_node& node(size_t index) const { return nodes.at(index); }
	[[nodiscard]] dom_node& node(size_t index) { return nodes.at(index); }

	size_t append_element(size_t parent, std::string tag, std::vector<std::pair<std::string, std::string>> attributes = {});
	size_t append_text(size_t parent, std::string text);
	size_t append_comment(size_t parent, std::string text);

	void detach(size_t index);
	void unwrap(size_t index);
	void merge_adjacent_text(size_t index);

	// Pre-order walk of the subtree rooted at index, the root included.
	[[nodiscard]] std::vector<size_t> descendants(size_t index) const;
	[[nodiscard]] size_t find_first(size_t index, const std::function<bool(const dom_node&)>& predicate) const;
	[[nodiscard]] size_t find_first_element(size_t index, std::string_view tag) const;

	[[nodiscard]] std::string text_content(size_t index) const;
	[[nodiscard]] std::string outer_html(size_t index) const;

private:
	std::vector<dom_node> nodes;

	size_t append_node(size_t parent, dom_node node);
	void append_text_content(size_t index, std::string& out) const;
	void serialize(size_t index, std::string& out) const;
};

[[nodiscard]] bool is_void_element(std::string_view tag) noexcept;
[[nodiscard]] bool is_block_element(std::string_view tag) noexcept;
[[nodiscard]] bool is_heading_element(std::string_view tag) noexcept;
[[nodiscard]] int heading_level(std::string_view tag) noexcept;
// Number of the first item of an ol: its start attribute, else 1.
[[nodiscard]] long ordered_list_start(const dom_node& list);
