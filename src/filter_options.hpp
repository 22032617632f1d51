/* filter_options.hpp - the closed set of content filters and their parameters.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <string>
#include <string_view>
#include <variant>

enum class threshold_type {
	fixed,
	dynamic
};

struct no_filter {
	bool operator==(const no_filter&) const = default;
};

struct pruning_options {
	double threshold{0.48};
	threshold_type type{threshold_type::fixed};
	int min_word_threshold{0};

	bool operator==(const pruning_options&) const = default;
};

struct bm25_options {
	std::string query;
	double threshold{1.0};
	double k1{1.2};
	double b{0.75};

	bool operator==(const bm25_options&) const = default;
};

using filter_options = std::variant<no_filter, pruning_options, bm25_options>;

// Pulls out-of-range parameters back to the nearest valid value instead of rejecting them.
[[nodiscard]] pruning_options clamp_options(const pruning_options& options) noexcept;
[[nodiscard]] bm25_options clamp_options(const bm25_options& options);
[[nodiscard]] filter_options clamp_options(const filter_options& options);
[[nodiscard]] std::string_view filter_name(const filter_options& options) noexcept;
