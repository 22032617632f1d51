/* pruning_filter.cpp - scores blocks by density, tag and class/id evidence and drops the weak ones.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pruning_filter.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <wx/log.h>

namespace {
constexpr std::array<std::pair<std::string_view, double>, 18> tag_weights = {{
	{"article", 1.5},
	{"main", 1.4},
	{"h1", 1.4},
	{"section", 1.3},
	{"h2", 1.3},
	{"p", 1.2},
	{"h3", 1.2},
	{"blockquote", 1.1},
	{"h4", 1.1},
	{"pre", 1.0},
	{"h5", 1.0},
	{"td", 0.9},
	{"h6", 0.9},
	{"div", 0.7},
	{"span", 0.6},
	{"li", 0.5},
	{"ul", 0.5},
	{"ol", 0.5},
}};

// Expected text length, in code points, of a genuine block with the given tag.
constexpr std::array<std::pair<std::string_view, size_t>, 12> length_baselines = {{
	{"p", 150},
	{"blockquote", 150},
	{"pre", 120},
	{"article", 300},
	{"section", 300},
	{"main", 300},
	{"div", 120},
	{"li", 60},
	{"td", 40},
	{"th", 20},
	{"dd", 60},
	{"figure", 60},
}};
constexpr size_t default_length_baseline = 80;
constexpr size_t heading_length_baseline = 25;

constexpr std::array<std::string_view, 8> positive_patterns = {
	"content",
	"article",
	"main",
	"post",
	"entry",
	"text",
	"body",
	"story",
};

constexpr std::array<std::string_view, 15> negative_patterns = {
	"nav",
	"navigation",
	"footer",
	"sidebar",
	"comment",
	"menu",
	"header",
	"promo",
	"social",
	"share",
	"related",
	"widget",
	"banner",
	"advert",
	"cookie",
};

// Too short to match as substrings without hitting words like "header" or "shadow".
constexpr std::array<std::string_view, 2> negative_tokens = {"ad", "ads"};
} // namespace

double tag_weight(std::string_view tag) noexcept {
	const auto it = std::find_if(tag_weights.begin(), tag_weights.end(), [tag](const auto& entry) {
		return entry.first == tag;
	});
	return it != tag_weights.end() ? it->second : 0.5;
}

double length_score(std::string_view tag, size_t text_length) noexcept {
	size_t baseline = default_length_baseline;
	if (is_heading_element(tag)) {
		baseline = heading_length_baseline;
	} else {
		const auto it = std::find_if(length_baselines.begin(), length_baselines.end(), [tag](const auto& entry) {
			return entry.first == tag;
		});
		if (it != length_baselines.end()) {
			baseline = it->second;
		}
	}
	return std::min(1.0, static_cast<double>(text_length) / static_cast<double>(baseline));
}

double class_id_score(std::string_view context) {
	if (context.empty()) {
		return 0.0;
	}
	int score = 0;
	for (const auto pattern : positive_patterns) {
		if (context.find(pattern) != std::string_view::npos) {
			++score;
		}
	}
	for (const auto pattern : negative_patterns) {
		if (context.find(pattern) != std::string_view::npos) {
			--score;
		}
	}
	const auto tokens = split_identifier_tokens(context);
	for (const auto token : negative_tokens) {
		if (std::find(tokens.begin(), tokens.end(), token) != tokens.end()) {
			--score;
		}
	}
	return static_cast<double>(std::clamp(score, -3, 1));
}

double score_block(const content_block& block) {
	return 0.25 * block.text_density() + 0.25 * (1.0 - block.link_density()) + 0.2 * tag_weight(block.tag) + 0.2 * length_score(block.tag, block.text_length) + 0.1 * class_id_score(block.class_id_context);
}

double pruning_cutoff(const std::vector<content_block>& blocks, const pruning_options& options) {
	if (options.type == threshold_type::fixed) {
		return options.threshold;
	}
	const auto floor = static_cast<size_t>(std::max(options.min_word_threshold, 0));
	double max_score = 0.0;
	bool any = false;
	for (const auto& block : blocks) {
		if (block.word_count < floor) {
			continue;
		}
		max_score = any ? std::max(max_score, block.score) : block.score;
		any = true;
	}
	return options.threshold * max_score;
}

void apply_pruning_threshold(std::vector<content_block>& blocks, const pruning_options& options) {
	const auto floor = static_cast<size_t>(std::max(options.min_word_threshold, 0));
	const double cutoff = pruning_cutoff(blocks, options);
	for (auto& block : blocks) {
		block.retained = block.word_count >= floor && block.score >= cutoff;
	}
}

void apply_pruning(std::vector<content_block>& blocks, const pruning_options& options) {
	for (auto& block : blocks) {
		block.score = score_block(block);
	}
	apply_pruning_threshold(blocks, options);
	wxLogDebug("Pruning kept %zu of %zu blocks (cutoff %.3f)", static_cast<size_t>(std::count_if(blocks.begin(), blocks.end(), [](const content_block& block) {
		return block.retained;
	})), blocks.size(), pruning_cutoff(blocks, options));
}
