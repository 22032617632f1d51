/* markdown_generator.cpp - runs normalization, filtering and conversion for one page.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "markdown_generator.hpp"
#include "content_filter.hpp"
#include "markdown_converter.hpp"
#include "utils.hpp"
#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <wx/log.h>
#include <wx/string.h>

namespace {
std::string element_text(const dom_tree& tree, size_t index) {
	return trim_string(collapse_whitespace(tree.text_content(index)));
}

// Skips indentation and quote markers, and list markers too when with_list_markers is set.
std::string_view strip_container_markers(std::string_view line, bool with_list_markers) noexcept {
	while (true) {
		const size_t start = line.find_first_not_of(' ');
		if (start == std::string_view::npos) {
			return {};
		}
		line.remove_prefix(start);
		if (line.front() == '>') {
			line.remove_prefix(1);
			continue;
		}
		if (!with_list_markers) {
			return line;
		}
		if (line.starts_with("- ")) {
			line.remove_prefix(2);
			continue;
		}
		const size_t digits = line.find_first_not_of("0123456789");
		if (digits > 0 && digits != std::string_view::npos && line.substr(digits).starts_with(". ")) {
			line.remove_prefix(digits + 2);
			continue;
		}
		return line;
	}
}

size_t backtick_run(std::string_view text) noexcept {
	const size_t end = text.find_first_not_of('`');
	return end == std::string_view::npos ? text.size() : end;
}

// Length of the backtick run opening a fenced block on this line, or 0.
size_t opening_fence(std::string_view line) noexcept {
	const size_t run = backtick_run(strip_container_markers(line, true));
	return run >= 3 ? run : 0;
}

// A closing fence holds nothing but a backtick run at least as long as the opening one.
bool is_closing_fence(std::string_view line, size_t opening_run) noexcept {
	const std::string_view content = strip_container_markers(line, false);
	const size_t run = backtick_run(content);
	return run >= opening_run && run == content.size();
}

std::string convert_fit_html(const std::string& fit_html, markdown_converter& converter) {
	const dom_tree fit_tree = dom_tree::parse(fit_html);
	if (fit_tree.empty()) {
		return {};
	}
	size_t body = fit_tree.find_first_element(fit_tree.root(), "body");
	if (body == dom_tree::npos) {
		body = fit_tree.root();
	}
	return clean_markdown(converter.convert(fit_tree, body));
}
} // namespace

markdown_result markdown_generator::generate(std::string_view html, std::string_view url, const filter_options& options) const {
	markdown_result result;
	try {
		const normalized_page page = normalizer.normalize(html);
		citation_registry citations;
		markdown_converter converter{std::string{url}, citations};
		if (page.has_content()) {
			result.raw_markdown = clean_markdown(converter.convert(page.tree, page.content_root));
		}
		result.title = find_title(page.tree, page.content_root);
		const filter_result filtered = run_content_filter(page, options);
		if (filtered.fit_requested) {
			std::string fit_html = filtered.fit_html();
			result.fit_markdown = convert_fit_html(fit_html, converter);
			result.fit_html = std::move(fit_html);
		}
		if (!citations.empty()) {
			result.references_markdown = citations.to_markdown();
		}
		wxLogVerbose("Generated %zu words of markdown with filter '%s' (%zu of %zu blocks kept, %zu citations)", result.word_count(), std::string{filter_name(options)}, filtered.retained_count(), filtered.blocks.size(), citations.size());
	} catch (const std::exception& e) {
		wxLogError("Markdown generation failed: %s", wxString::FromUTF8(e.what()));
		return markdown_result{};
	}
	return result;
}

std::optional<std::string> find_title(const dom_tree& tree, size_t content_root) {
	if (tree.empty()) {
		return std::nullopt;
	}
	if (content_root != dom_tree::npos) {
		const size_t heading = tree.find_first_element(content_root, "h1");
		if (heading != dom_tree::npos) {
			std::string text = element_text(tree, heading);
			if (!text.empty()) {
				return text;
			}
		}
	}
	const size_t title = tree.find_first_element(tree.root(), "title");
	if (title != dom_tree::npos) {
		std::string text = element_text(tree, title);
		if (!text.empty()) {
			return text;
		}
	}
	return std::nullopt;
}

std::string clean_markdown(std::string_view markdown) {
	std::vector<std::string> lines;
	size_t fence_run = 0;
	size_t start = 0;
	while (start <= markdown.size()) {
		size_t end = markdown.find('\n', start);
		if (end == std::string_view::npos) {
			end = markdown.size();
		}
		std::string line{markdown.substr(start, end - start)};
		start = end + 1;
		if (fence_run > 0) {
			if (is_closing_fence(line, fence_run)) {
				fence_run = 0;
			}
			lines.push_back(std::move(line));
			continue;
		}
		while (!line.empty() && (line.back() == ' ' || line.back() == '\t' || line.back() == '\r')) {
			line.pop_back();
		}
		if (line.empty() && (lines.empty() || lines.back().empty())) {
			continue;
		}
		fence_run = opening_fence(line);
		lines.push_back(std::move(line));
	}
	while (!lines.empty() && lines.back().empty()) {
		lines.pop_back();
	}
	std::string result;
	for (size_t i = 0; i < lines.size(); ++i) {
		if (i > 0) {
			result += '\n';
		}
		result += lines[i];
	}
	return result;
}
