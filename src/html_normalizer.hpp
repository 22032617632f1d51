/* html_normalizer.hpp - HTML cleaning and main content extraction header file.
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
#include <string>
#include <string_view>

struct normalized_page {
	dom_tree tree;
	size_t content_root{dom_tree::npos};

	[[nodiscard]] bool has_content() const noexcept { return content_root != dom_tree::npos; }
};

class html_normalizer {
public:
	explicit html_normalizer(const cleaning_policy& p = cleaning_policy::defaults()) noexcept : policy{p} {
	}

	// Parses, cleans and isolates the main content region. Blank input gives a page without content.
	[[nodiscard]] normalized_page normalize(std::string_view html) const;

	// Plain text of the cleaned body, one line per block, with inline formatting tags unwrapped.
	[[nodiscard]] std::string extract_text(std::string_view html) const;

	void clean(dom_tree& tree) const;
	void unwrap_tags(dom_tree& tree, size_t root) const;
	[[nodiscard]] size_t select_main_content(dom_tree& tree) const;

	static void remove_comments(dom_tree& tree);
	void remove_tags(dom_tree& tree) const;
	static void remove_hidden(dom_tree& tree);

private:
	const cleaning_policy& policy;
};
