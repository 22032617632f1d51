/* markdown_converter.cpp - handles the conversion of a cleaned DOM tree into markdown.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "markdown_converter.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {
constexpr bool is_skipped_element(std::string_view tag_name) noexcept {
	constexpr std::array skipped_elements = {
		"head",
		"title",
		"meta",
		"link",
		"base",
		"template",
	};
	return std::find(skipped_elements.begin(), skipped_elements.end(), tag_name) != skipped_elements.end();
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
	std::string result;
	for (const auto& part : parts) {
		if (!result.empty()) {
			result += separator;
		}
		result += part;
	}
	return result;
}

std::vector<std::string> split_lines(std::string_view text) {
	std::vector<std::string> lines;
	size_t start = 0;
	while (start <= text.size()) {
		size_t end = text.find('\n', start);
		if (end == std::string_view::npos) {
			end = text.size();
		}
		lines.emplace_back(text.substr(start, end - start));
		start = end + 1;
	}
	return lines;
}

// Collapses each line of inline output and drops the empty ones.
std::string normalize_inline(std::string_view text) {
	std::string result;
	for (const auto& line : split_lines(text)) {
		const std::string cleaned = trim_string(collapse_whitespace(line));
		if (cleaned.empty()) {
			continue;
		}
		if (!result.empty()) {
			result += '\n';
		}
		result += cleaned;
	}
	return result;
}

std::string single_line(std::string_view text) {
	std::string result = normalize_inline(text);
	std::replace(result.begin(), result.end(), '\n', ' ');
	return result;
}

std::string wrap_inline(const std::string& inner, std::string_view marker) {
	const std::string core = trim_string(inner);
	if (core.empty()) {
		return inner;
	}
	std::string result;
	if (inner.front() == ' ') {
		result += ' ';
	}
	result += marker;
	result += core;
	result += marker;
	if (inner.back() == ' ') {
		result += ' ';
	}
	return result;
}

std::string inline_code(const std::string& text) {
	const std::string code = trim_string(collapse_whitespace(text));
	if (code.empty()) {
		return {};
	}
	if (code.find('`') != std::string::npos) {
		return "`` " + code + " ``";
	}
	return "`" + code + "`";
}

std::string code_language(const dom_node& node) {
	const auto classes = node.attribute("class");
	if (!classes) {
		return {};
	}
	std::istringstream iss{std::string{*classes}};
	std::string token;
	while (iss >> token) {
		if (token.starts_with("language-") && token.size() > 9) {
			return token.substr(9);
		}
		if (token.starts_with("lang-") && token.size() > 5) {
			return token.substr(5);
		}
	}
	return {};
}

std::string markdown_url(const std::string& url) {
	std::string result;
	result.reserve(url.size());
	for (const char ch : url) {
		if (ch == ' ') {
			result += "%20";
		} else {
			result += ch;
		}
	}
	return result;
}

std::string escape_table_cell(const std::string& text) {
	std::string result;
	result.reserve(text.size());
	for (const char ch : text) {
		if (ch == '|') {
			result += "\\|";
		} else {
			result += ch;
		}
	}
	return result;
}

std::string prefix_lines(const std::string& text, std::string_view first, std::string_view rest) {
	std::string result;
	bool first_line = true;
	for (const auto& line : split_lines(text)) {
		if (!first_line) {
			result += '\n';
		}
		if (!line.empty()) {
			result += first_line ? first : rest;
			result += line;
		}
		first_line = false;
	}
	return result;
}
} // namespace

size_t citation_registry::add(const std::string& url, const std::string& text) {
	const auto it = numbers.find(url);
	if (it != numbers.end()) {
		return it->second;
	}
	if (citations.size() >= MAX_CITATIONS) {
		return 0;
	}
	citations.push_back({url, text});
	numbers.emplace(url, citations.size());
	return citations.size();
}

std::string citation_registry::to_markdown() const {
	if (citations.empty()) {
		return {};
	}
	std::ostringstream oss;
	oss << "## References\n";
	for (size_t i = 0; i < citations.size(); ++i) {
		const auto& entry = citations[i];
		oss << "\n[" << i + 1 << "] [" << (entry.text.empty() ? entry.url : entry.text) << "](" << entry.url << ")";
	}
	return oss.str();
}

markdown_converter::markdown_converter(std::string base_url, citation_registry& citations) : base_url{std::move(base_url)}, citations{citations} {
}

std::string markdown_converter::convert(const dom_tree& source, size_t root) {
	tree = &source;
	if (root == dom_tree::npos || root >= source.size()) {
		return {};
	}
	std::vector<std::string> chunks;
	if (source.node(root).is_text()) {
		const std::string text = normalize_inline(render_inline(root));
		if (!text.empty()) {
			chunks.push_back(text);
		}
	} else {
		append_block(root, chunks);
	}
	return join(chunks, "\n\n");
}

void markdown_converter::append_blocks(size_t parent, std::vector<std::string>& chunks) {
	std::string run;
	auto flush_run = [&chunks, &run]() {
		std::string text = normalize_inline(run);
		if (!text.empty()) {
			chunks.push_back(std::move(text));
		}
		run.clear();
	};
	for (const size_t child : tree->node(parent).children) {
		const auto& node = tree->node(child);
		if (node.is_element() && is_skipped_element(node.tag)) {
			continue;
		}
		if (node.is_element() && is_block_element(node.tag)) {
			flush_run();
			append_block(child, chunks);
		} else {
			run += render_inline(child);
		}
	}
	flush_run();
}

void markdown_converter::append_block(size_t index, std::vector<std::string>& chunks) {
	const auto& node = tree->node(index);
	if (!node.is_element() || is_skipped_element(node.tag)) {
		return;
	}
	std::string chunk;
	if (is_heading_element(node.tag)) {
		chunk = render_heading(index);
	} else if (node.tag == "ul" || node.tag == "ol") {
		chunk = render_list(index);
	} else if (node.tag == "pre") {
		chunk = render_code_block(index);
	} else if (node.tag == "blockquote") {
		chunk = render_blockquote(index);
	} else if (node.tag == "table") {
		chunk = render_table(index);
	} else if (node.tag == "hr") {
		chunk = "---";
	} else {
		append_blocks(index, chunks);
		return;
	}
	if (!chunk.empty()) {
		chunks.push_back(std::move(chunk));
	}
}

std::string markdown_converter::render_inline(size_t index) {
	const auto& node = tree->node(index);
	if (node.is_text()) {
		return collapse_whitespace(remove_soft_hyphens(node.text));
	}
	if (!node.is_element() || is_skipped_element(node.tag)) {
		return {};
	}
	const std::string_view tag = node.tag;
	if (tag == "br") {
		return "\n";
	}
	if (tag == "strong" || tag == "b") {
		return wrap_inline(render_inline_children(index), "**");
	}
	if (tag == "em" || tag == "i") {
		return wrap_inline(render_inline_children(index), "*");
	}
	if (tag == "code") {
		return inline_code(tree->text_content(index));
	}
	if (tag == "a") {
		return render_link(index);
	}
	if (tag == "img") {
		return render_image(index);
	}
	if (is_block_element(tag)) {
		return "\n" + render_inline_children(index) + "\n";
	}
	return render_inline_children(index);
}

std::string markdown_converter::render_inline_children(size_t index) {
	std::string result;
	for (const size_t child : tree->node(index).children) {
		result += render_inline(child);
	}
	return result;
}

std::string markdown_converter::render_heading(size_t index) {
	const std::string text = single_line(render_inline_children(index));
	if (text.empty()) {
		return {};
	}
	return std::string(static_cast<size_t>(heading_level(tree->node(index).tag)), '#') + " " + text;
}

std::string markdown_converter::render_list(size_t index) {
	const auto& node = tree->node(index);
	const bool ordered = node.tag == "ol";
	long number = ordered ? ordered_list_start(node) : 1;
	std::vector<std::string> items;
	for (const size_t child : node.children) {
		const auto& item = tree->node(child);
		if (!item.is_element()) {
			continue;
		}
		if (item.tag == "li") {
			const std::string marker = ordered ? std::to_string(number++) + "." : "-";
			std::vector<std::string> parts;
			append_blocks(child, parts);
			if (parts.empty()) {
				continue;
			}
			items.push_back(prefix_lines(join(parts, "\n"), marker + " ", "  "));
		} else if (item.tag == "ul" || item.tag == "ol") {
			const std::string nested = render_list(child);
			if (!nested.empty()) {
				items.push_back(prefix_lines(nested, "  ", "  "));
			}
		}
	}
	return join(items, "\n");
}

std::string markdown_converter::render_code_block(size_t index) const {
	const auto& node = tree->node(index);
	std::string language = code_language(node);
	if (language.empty()) {
		const size_t code = tree->find_first_element(index, "code");
		if (code != dom_tree::npos) {
			language = code_language(tree->node(code));
		}
	}
	std::string text = tree->text_content(index);
	while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
		text.pop_back();
	}
	if (trim_string(text).empty()) {
		return {};
	}
	std::string fence = "```";
	while (text.find(fence) != std::string::npos) {
		fence += '`';
	}
	return fence + language + "\n" + text + "\n" + fence;
}

std::string markdown_converter::render_blockquote(size_t index) {
	std::vector<std::string> parts;
	append_blocks(index, parts);
	const std::string inner = join(parts, "\n\n");
	if (inner.empty()) {
		return {};
	}
	std::string result;
	bool first = true;
	for (const auto& line : split_lines(inner)) {
		if (!first) {
			result += '\n';
		}
		result += line.empty() ? ">" : "> " + line;
		first = false;
	}
	return result;
}

std::string markdown_converter::render_table(size_t index) {
	std::vector<std::vector<std::string>> rows;
	for (const size_t row : tree->descendants(index)) {
		const auto& row_node = tree->node(row);
		if (!row_node.is_element() || row_node.tag != "tr") {
			continue;
		}
		size_t owner = row_node.parent;
		while (owner != dom_tree::npos && tree->node(owner).tag != "table") {
			owner = tree->node(owner).parent;
		}
		if (owner != index) {
			continue;
		}
		std::vector<std::string> cells;
		for (const size_t cell : row_node.children) {
			const auto& cell_node = tree->node(cell);
			if (cell_node.is_element() && (cell_node.tag == "td" || cell_node.tag == "th")) {
				cells.push_back(escape_table_cell(single_line(render_inline_children(cell))));
			}
		}
		if (!cells.empty()) {
			rows.push_back(std::move(cells));
		}
	}
	size_t columns = 0;
	for (const auto& row : rows) {
		columns = std::max(columns, row.size());
	}
	if (columns == 0) {
		return {};
	}
	std::vector<std::string> lines;
	for (auto& row : rows) {
		row.resize(columns);
		lines.push_back("| " + join(row, " | ") + " |");
	}
	std::string separator = "|";
	for (size_t i = 0; i < columns; ++i) {
		separator += " --- |";
	}
	lines.insert(lines.begin() + 1, separator);
	return join(lines, "\n");
}

std::string markdown_converter::render_link(size_t index) {
	const auto& node = tree->node(index);
	const std::string inner = render_inline_children(index);
	const std::string text = single_line(inner);
	if (text.empty()) {
		return inner.empty() ? std::string{} : std::string{" "};
	}
	const std::string leading = inner.front() == ' ' ? " " : "";
	const std::string trailing = inner.back() == ' ' ? " " : "";
	const auto href_attr = node.attribute("href");
	const std::string href = href_attr ? trim_string(std::string{*href_attr}) : std::string{};
	if (href.empty() || href.front() == '#' || to_lower_ascii(href).starts_with("javascript:")) {
		return leading + text + trailing;
	}
	const std::string url = markdown_url(resolve_url(base_url, href));
	std::string label = trim_string(collapse_whitespace(tree->text_content(index)));
	citations.add(url, label.empty() ? text : label);
	return leading + "[" + text + "](" + url + ")" + trailing;
}

std::string markdown_converter::render_image(size_t index) const {
	const auto& node = tree->node(index);
	const auto alt_attr = node.attribute("alt");
	const std::string alt = alt_attr ? trim_string(collapse_whitespace(*alt_attr)) : std::string{};
	const auto src_attr = node.attribute("src");
	const std::string src = src_attr ? trim_string(std::string{*src_attr}) : std::string{};
	if (src.empty() || to_lower_ascii(src).starts_with("data:")) {
		return alt;
	}
	return "![" + alt + "](" + markdown_url(resolve_url(base_url, src)) + ")";
}
