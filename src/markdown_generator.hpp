/* markdown_generator.hpp - HTML page to LLM-ready markdown header file.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "cleaning_policy.hpp"
#include "dom_tree.hpp"
#include "filter_options.hpp"
#include "html_normalizer.hpp"
#include "markdown_result.hpp"
#include <optional>
#include <string>
#include <string_view>

class markdown_generator {
public:
	explicit markdown_generator(const cleaning_policy& p = cleaning_policy::defaults()) noexcept : normalizer{p} {
	}

	// Never throws: failures are logged and give an empty result.
	[[nodiscard]] markdown_result generate(std::string_view html, std::string_view url = {}, const filter_options& options = no_filter{}) const;
	[[nodiscard]] const html_normalizer& get_normalizer() const noexcept { return normalizer; }

private:
	html_normalizer normalizer;
};

// First h1 below the content root, else the document title.
[[nodiscard]] std::optional<std::string> find_title(const dom_tree& tree, size_t content_root);

// Trims trailing whitespace, collapses blank line runs outside fenced code and strips blank lines at both ends.
[[nodiscard]] std::string clean_markdown(std::string_view markdown);
