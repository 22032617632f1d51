/* markdown_result.hpp - value returned by one markdown generation.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "utils.hpp"
#include <optional>
#include <string>

struct markdown_result {
	std::string raw_markdown;
	std::optional<std::string> fit_markdown;
	std::optional<std::string> fit_html;
	std::optional<std::string> title;
	std::optional<std::string> references_markdown;

	// Counts the filtered markdown when a filter ran, the raw markdown otherwise.
	[[nodiscard]] size_t word_count() const noexcept { return count_words(fit_markdown ? *fit_markdown : raw_markdown); }
	[[nodiscard]] bool has_fit() const noexcept { return fit_markdown.has_value(); }

	bool operator==(const markdown_result&) const = default;
};
