/* bm25_filter.hpp - query-driven block relevance header file.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "content_block.hpp"
#include "dom_tree.hpp"
#include "filter_options.hpp"
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Blocks kept, highest score first, when nothing reaches the threshold. Only blocks with a positive score qualify.
inline constexpr size_t BM25_FALLBACK_BLOCKS = 3;

// Case-folded letter and digit runs of at least two characters. No stemming, and no dependence on the locale.
[[nodiscard]] std::vector<std::string> tokenize_for_bm25(std::string_view text);

class bm25_index {
public:
	bm25_index(const std::vector<std::vector<std::string>>& documents, double saturation, double length_weight);
	~bm25_index() = default;
	bm25_index(const bm25_index&) = default;
	bm25_index& operator=(const bm25_index&) = default;
	bm25_index(bm25_index&&) = default;
	bm25_index& operator=(bm25_index&&) = default;

	[[nodiscard]] std::vector<double> scores(const std::vector<std::string>& query) const;
	[[nodiscard]] double idf(const std::string& term) const;
	[[nodiscard]] size_t size() const noexcept { return lengths.size(); }

private:
	std::vector<std::unordered_map<std::string, size_t>> term_frequencies;
	std::vector<size_t> lengths;
	std::unordered_map<std::string, size_t> document_frequencies;
	double average_length{0.0};
	double k1;
	double b;
};

[[nodiscard]] double bm25_priority_weight(std::string_view tag) noexcept;

// Title, then meta description, then meta keywords, then the first h1, then the first long paragraph.
[[nodiscard]] std::string derive_page_query(const dom_tree& tree);

// Scores blocks against the query and marks the retained ones. The query must already be resolved.
void select_bm25_blocks(std::vector<content_block>& blocks, const bm25_options& options);

// Resolves an empty query from page metadata first. Without any query terms nothing is retained.
void apply_bm25(const dom_tree& tree, std::vector<content_block>& blocks, const bm25_options& options);
