/* filter_options.cpp - parameter clamping for the content filters.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "filter_options.hpp"
#include <algorithm>
#include <cmath>
#include <type_traits>

namespace {
double clamp_non_negative(double value, double fallback) noexcept {
	if (std::isnan(value)) {
		return fallback;
	}
	return std::max(value, 0.0);
}
} // namespace

pruning_options clamp_options(const pruning_options& options) noexcept {
	pruning_options clamped = options;
	clamped.threshold = clamp_non_negative(options.threshold, pruning_options{}.threshold);
	clamped.min_word_threshold = std::max(options.min_word_threshold, 0);
	return clamped;
}

bm25_options clamp_options(const bm25_options& options) {
	bm25_options clamped = options;
	clamped.threshold = clamp_non_negative(options.threshold, bm25_options{}.threshold);
	clamped.k1 = clamp_non_negative(options.k1, bm25_options{}.k1);
	clamped.b = std::isnan(options.b) ? bm25_options{}.b : std::clamp(options.b, 0.0, 1.0);
	return clamped;
}

filter_options clamp_options(const filter_options& options) {
	return std::visit(
		[](const auto& opts) -> filter_options {
			if constexpr (std::is_same_v<std::decay_t<decltype(opts)>, no_filter>) {
				return opts;
			} else {
				return clamp_options(opts);
			}
		},
		options);
}

std::string_view filter_name(const filter_options& options) noexcept {
	switch (options.index()) {
		case 1:
			return "pruning";
		case 2:
			return "bm25";
		default:
			return "none";
	}
}
