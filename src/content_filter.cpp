/* content_filter.cpp - runs the selected filter over a normalized page.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "content_filter.hpp"
#include "bm25_filter.hpp"
#include "pruning_filter.hpp"
#include <algorithm>
#include <type_traits>
#include <wx/log.h>

size_t filter_result::retained_count() const noexcept {
	return static_cast<size_t>(std::count_if(blocks.begin(), blocks.end(), [](const content_block& block) {
		return block.retained;
	}));
}

std::string filter_result::fit_html() const {
	std::string html;
	for (const auto& block : blocks) {
		if (!block.retained) {
			continue;
		}
		if (!html.empty()) {
			html += '\n';
		}
		html += block.html;
	}
	return html;
}

filter_result run_content_filter(const normalized_page& page, const filter_options& options) {
	filter_result result;
	result.blocks = collect_content_blocks(page.tree, page.content_root);
	const filter_options clamped = clamp_options(options);
	std::visit(
		[&page, &result](const auto& opts) {
			using option_type = std::decay_t<decltype(opts)>;
			if constexpr (std::is_same_v<option_type, no_filter>) {
				for (auto& block : result.blocks) {
					block.retained = true;
				}
			} else if constexpr (std::is_same_v<option_type, pruning_options>) {
				result.fit_requested = true;
				apply_pruning(result.blocks, opts);
			} else {
				result.fit_requested = true;
				apply_bm25(page.tree, result.blocks, opts);
			}
		},
		clamped);
	wxLogDebug("Filter '%s' retained %zu of %zu blocks", std::string{filter_name(clamped)}, result.retained_count(), result.blocks.size());
	return result;
}
