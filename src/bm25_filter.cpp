/* bm25_filter.cpp - Okapi BM25 scoring of content blocks against a query.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "bm25_filter.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <numeric>
#include <utility>
#include <wx/log.h>
#include <wx/string.h>

namespace {
constexpr std::array<std::pair<std::string_view, double>, 6> priority_weights = {{
	{"h1", 5.0},
	{"h2", 4.0},
	{"h3", 3.0},
	{"blockquote", 2.0},
	{"pre", 1.5},
	{"th", 1.5},
}};

constexpr size_t query_paragraph_min_length = 50;
constexpr size_t query_paragraph_max_length = 200;

std::string meta_content(const dom_tree& tree, std::string_view name) {
	const size_t meta = tree.find_first(tree.root(), [name](const dom_node& node) {
		if (!node.is_element() || node.tag != "meta") {
			return false;
		}
		const auto value = node.attribute("name");
		return value && to_lower_ascii(*value) == name;
	});
	if (meta == dom_tree::npos) {
		return {};
	}
	const auto content = tree.node(meta).attribute("content");
	return content ? trim_string(collapse_whitespace(*content)) : std::string{};
}

// Simple case folding for Latin, Greek and Cyrillic letters that ignores the process locale.
wxUint32 fold_case(wxUint32 code) noexcept {
	if (code < 0x80) {
		return code >= 'A' && code <= 'Z' ? code + 0x20 : code;
	}
	if (code >= 0xC0 && code <= 0xDE && code != 0xD7) {
		return code + 0x20;
	}
	if (code == 0x130) {
		return 'i';
	}
	if (code == 0x178) {
		return 0xFF;
	}
	if ((code >= 0x100 && code <= 0x137) || (code >= 0x14A && code <= 0x177)) {
		return code % 2 == 0 ? code + 1 : code;
	}
	if ((code >= 0x139 && code <= 0x148) || (code >= 0x179 && code <= 0x17E)) {
		return code % 2 == 1 ? code + 1 : code;
	}
	if (code >= 0x391 && code <= 0x3AB && code != 0x3A2) {
		return code + 0x20;
	}
	if (code >= 0x410 && code <= 0x42F) {
		return code + 0x20;
	}
	if (code >= 0x400 && code <= 0x40F) {
		return code + 0x50;
	}
	return code;
}

// ASCII letters and digits, plus every non-ASCII code point outside the symbol and punctuation blocks.
bool is_token_char(wxUint32 code) noexcept {
	if (code < 0x80) {
		return (code >= 'a' && code <= 'z') || (code >= 'A' && code <= 'Z') || (code >= '0' && code <= '9');
	}
	if (code < 0xC0) {
		return code == 0xAA || code == 0xB5 || code == 0xBA;
	}
	if (code == 0xD7 || code == 0xF7) {
		return false;
	}
	constexpr std::array<std::pair<wxUint32, wxUint32>, 7> separator_ranges = {{
		{0x2000, 0x2BFF},
		{0x2E00, 0x2E7F},
		{0x3000, 0x303F},
		{0xFE30, 0xFE4F},
		{0xFF00, 0xFF0F},
		{0xFF1A, 0xFF20},
		{0xFFF0, 0xFFFF},
	}};
	if (code >= 0x1F000) {
		return false;
	}
	return std::none_of(separator_ranges.begin(), separator_ranges.end(), [code](const auto& range) {
		return code >= range.first && code <= range.second;
	});
}

std::string first_element_text(const dom_tree& tree, std::string_view tag) {
	const size_t index = tree.find_first_element(tree.root(), tag);
	return index != dom_tree::npos ? trim_string(collapse_whitespace(tree.text_content(index))) : std::string{};
}
} // namespace

std::vector<std::string> tokenize_for_bm25(std::string_view text) {
	std::vector<std::string> tokens;
	const wxString decoded = wxString::FromUTF8(text.data(), text.size());
	wxString current;
	auto flush = [&tokens, &current]() {
		if (current.length() >= 2) {
			tokens.push_back(current.utf8_string());
		}
		current.clear();
	};
	for (const auto ch : decoded) {
		const wxUint32 code = static_cast<wxUint32>(ch.GetValue());
		if (is_token_char(code)) {
			current += wxUniChar(fold_case(code));
		} else {
			flush();
		}
	}
	flush();
	return tokens;
}

bm25_index::bm25_index(const std::vector<std::vector<std::string>>& documents, double saturation, double length_weight) : k1{saturation}, b{length_weight} {
	term_frequencies.reserve(documents.size());
	lengths.reserve(documents.size());
	for (const auto& document : documents) {
		std::unordered_map<std::string, size_t> frequencies;
		for (const auto& term : document) {
			++frequencies[term];
		}
		for (const auto& [term, count] : frequencies) {
			++document_frequencies[term];
		}
		term_frequencies.push_back(std::move(frequencies));
		lengths.push_back(document.size());
	}
	if (!lengths.empty()) {
		average_length = static_cast<double>(std::accumulate(lengths.begin(), lengths.end(), size_t{0})) / static_cast<double>(lengths.size());
	}
}

double bm25_index::idf(const std::string& term) const {
	const auto it = document_frequencies.find(term);
	const double df = it != document_frequencies.end() ? static_cast<double>(it->second) : 0.0;
	const auto n = static_cast<double>(lengths.size());
	return std::log((n - df + 0.5) / (df + 0.5) + 1.0);
}

std::vector<double> bm25_index::scores(const std::vector<std::string>& query) const {
	std::vector<double> result(lengths.size(), 0.0);
	for (const auto& term : query) {
		if (document_frequencies.find(term) == document_frequencies.end()) {
			continue;
		}
		const double term_idf = idf(term);
		for (size_t i = 0; i < lengths.size(); ++i) {
			const auto it = term_frequencies[i].find(term);
			if (it == term_frequencies[i].end()) {
				continue;
			}
			const auto tf = static_cast<double>(it->second);
			const double relative_length = average_length > 0.0 ? static_cast<double>(lengths[i]) / average_length : 0.0;
			result[i] += term_idf * (tf * (k1 + 1.0)) / (tf + k1 * (1.0 - b + b * relative_length));
		}
	}
	return result;
}

double bm25_priority_weight(std::string_view tag) noexcept {
	const auto it = std::find_if(priority_weights.begin(), priority_weights.end(), [tag](const auto& entry) {
		return entry.first == tag;
	});
	return it != priority_weights.end() ? it->second : 1.0;
}

std::string derive_page_query(const dom_tree& tree) {
	if (tree.empty()) {
		return {};
	}
	for (auto candidate : {first_element_text(tree, "title"), meta_content(tree, "description"), meta_content(tree, "keywords"), first_element_text(tree, "h1")}) {
		if (!candidate.empty()) {
			return candidate;
		}
	}
	for (const size_t index : tree.descendants(tree.root())) {
		const auto& node = tree.node(index);
		if (!node.is_element() || node.tag != "p") {
			continue;
		}
		const std::string text = trim_string(collapse_whitespace(tree.text_content(index)));
		if (text.size() > query_paragraph_min_length) {
			const wxString wide = wxString::FromUTF8(text);
			return wide.Left(query_paragraph_max_length).utf8_string();
		}
	}
	return {};
}

void select_bm25_blocks(std::vector<content_block>& blocks, const bm25_options& options) {
	for (auto& block : blocks) {
		block.score = 0.0;
		block.retained = false;
	}
	const auto query = tokenize_for_bm25(options.query);
	if (query.empty() || blocks.empty()) {
		return;
	}
	std::vector<std::vector<std::string>> documents;
	documents.reserve(blocks.size());
	for (const auto& block : blocks) {
		documents.push_back(tokenize_for_bm25(block.text));
	}
	const bm25_index index{documents, options.k1, options.b};
	const auto scores = index.scores(query);
	bool any_retained = false;
	for (size_t i = 0; i < blocks.size(); ++i) {
		blocks[i].score = scores[i] * bm25_priority_weight(blocks[i].tag);
		blocks[i].retained = blocks[i].score >= options.threshold;
		any_retained = any_retained || blocks[i].retained;
	}
	if (any_retained) {
		return;
	}
	std::vector<size_t> order(blocks.size());
	std::iota(order.begin(), order.end(), size_t{0});
	std::stable_sort(order.begin(), order.end(), [&blocks](size_t lhs, size_t rhs) {
		return blocks[lhs].score > blocks[rhs].score;
	});
	for (size_t i = 0; i < order.size() && i < BM25_FALLBACK_BLOCKS; ++i) {
		if (blocks[order[i]].score > 0.0) {
			blocks[order[i]].retained = true;
		}
	}
	wxLogDebug("No block reached the BM25 threshold %.3f, kept the best positive blocks", options.threshold);
}

void apply_bm25(const dom_tree& tree, std::vector<content_block>& blocks, const bm25_options& options) {
	bm25_options resolved = options;
	resolved.query = convert_to_utf8(options.query);
	if (trim_string(resolved.query).empty()) {
		resolved.query = derive_page_query(tree);
		if (resolved.query.empty()) {
			wxLogDebug("No query given and none derivable from the page");
		} else {
			wxLogDebug("Using page query '%s'", wxString::FromUTF8(resolved.query));
		}
	}
	select_bm25_blocks(blocks, resolved);
}
