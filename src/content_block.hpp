/* content_block.hpp - units of retain/drop decisions made by the content filters.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "dom_tree.hpp"
#include <cstddef>
#include <string>
#include <vector>

struct content_block {
	std::vector<size_t> nodes;
	std::string tag;
	std::string text;
	std::string html;
	std::string class_id_context;
	size_t text_length{0};
	size_t html_length{0};
	size_t link_text_length{0};
	size_t word_count{0};
	double score{0.0};
	bool retained{false};

	// Share of the block's markup that is visible text.
	[[nodiscard]] double text_density() const noexcept {
		return html_length > 0 ? static_cast<double>(text_length) / static_cast<double>(html_length) : 0.0;
	}

	// Share of the block's text that sits inside anchors. Blocks without text count as all links.
	[[nodiscard]] double link_density() const noexcept {
		return text_length > 0 ? static_cast<double>(link_text_length) / static_cast<double>(text_length) : 1.0;
	}
};

// Splits the subtree under root into content blocks in document order. A heading directly followed by a content block is folded into that block.
[[nodiscard]] std::vector<content_block> collect_content_blocks(const dom_tree& tree, size_t root);

// Text of a subtree with a space at every block and line break boundary, collapsed and trimmed.
[[nodiscard]] std::string block_text(const dom_tree& tree, size_t index);
