/* markdown_converter.hpp - DOM tree to markdown header file.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "dom_tree.hpp"
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Links beyond this many distinct URLs stay inline but get no reference entry.
inline constexpr size_t MAX_CITATIONS = 50;

// Numbered link targets, deduplicated by resolved URL in first occurrence order.
class citation_registry {
public:
	// Returns the 1-based number of the URL, registering it on first sight. Returns 0 for a new URL once the registry is full.
	size_t add(const std::string& url, const std::string& text);
	[[nodiscard]] bool empty() const noexcept { return citations.empty(); }
	[[nodiscard]] size_t size() const noexcept { return citations.size(); }
	[[nodiscard]] std::string to_markdown() const;

private:
	struct citation {
		std::string url;
		std::string text;
	};

	std::vector<citation> citations;
	std::unordered_map<std::string, size_t> numbers;
};

class markdown_converter {
public:
	markdown_converter(std::string base_url, citation_registry& citations);
	~markdown_converter() = default;
	markdown_converter(const markdown_converter&) = delete;
	markdown_converter& operator=(const markdown_converter&) = delete;
	markdown_converter(markdown_converter&&) = default;
	markdown_converter& operator=(markdown_converter&&) = delete;

	// Converts the subtree rooted at root. The result is not yet cleaned up.
	[[nodiscard]] std::string convert(const dom_tree& source, size_t root);

private:
	std::string base_url;
	citation_registry& citations;
	const dom_tree* tree{nullptr};

	void append_blocks(size_t parent, std::vector<std::string>& chunks);
	void append_block(size_t index, std::vector<std::string>& chunks);
	[[nodiscard]] std::string render_inline(size_t index);
	[[nodiscard]] std::string render_inline_children(size_t index);
	[[nodiscard]] std::string render_heading(size_t index);
	[[nodiscard]] std::string render_list(size_t index);
	[[nodiscard]] std::string render_code_block(size_t index) const;
	[[nodiscard]] std::string render_blockquote(size_t index);
	[[nodiscard]] std::string render_table(size_t index);
	[[nodiscard]] std::string render_link(size_t index);
	[[nodiscard]] std::string render_image(size_t index) const;
};
