/* utils.cpp - miscellaneous helpers shared across Pagemark.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include <cctype>
#include <cstddef>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <wx/strconv.h>
#include <wx/string.h>

namespace {
constexpr unsigned char UTF8_NBSP_FIRST = 0xC2;
constexpr unsigned char UTF8_NBSP_SECOND = 0xA0;

struct url_parts {
	std::string scheme;
	std::string authority;
	std::string path;
	std::string query;
	bool has_authority = false;
};

url_parts split_url(std::string_view url) {
	url_parts parts;
	const auto colon = url.find(':');
	parts.scheme = std::string(url.substr(0, colon));
	std::string_view rest = url.substr(colon + 1);
	if (rest.starts_with("//")) {
		rest.remove_prefix(2);
		const auto authority_end = rest.find_first_of("/?#");
		parts.authority = std::string(rest.substr(0, authority_end));
		parts.has_authority = true;
		rest = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);
	}
	const auto fragment = rest.find('#');
	if (fragment != std::string_view::npos) {
		rest = rest.substr(0, fragment);
	}
	const auto query = rest.find('?');
	parts.path = std::string(rest.substr(0, query));
	if (query != std::string_view::npos) {
		parts.query = std::string(rest.substr(query));
	}
	return parts;
}

std::string remove_dot_segments(const std::string& path) {
	std::vector<std::string> output;
	size_t pos = 0;
	const bool absolute = !path.empty() && path[0] == '/';
	bool trailing_slash = false;
	while (pos <= path.size()) {
		const auto next = path.find('/', pos);
		const std::string segment = path.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
		trailing_slash = false;
		if (segment == "..") {
			if (!output.empty()) {
				output.pop_back();
			}
			trailing_slash = true;
		} else if (segment == ".") {
			trailing_slash = true;
		} else if (!segment.empty()) {
			output.push_back(segment);
		} else if (next == std::string::npos && pos > 0) {
			trailing_slash = true;
		}
		if (next == std::string::npos) {
			break;
		}
		pos = next + 1;
	}
	std::string result = absolute ? "/" : "";
	for (size_t i = 0; i < output.size(); ++i) {
		if (i > 0) {
			result += '/';
		}
		result += output[i];
	}
	if (trailing_slash && !output.empty()) {
		result += '/';
	}
	return result;
}
} // namespace

std::string collapse_whitespace(std::string_view input) {
	auto result = std::ostringstream{};
	bool prev_was_space = false;
	for (size_t i = 0; i < input.size(); ++i) {
		const auto ch = static_cast<unsigned char>(input[i]);
		// Check for non-breaking space (UTF-8: 0xC2A0)
		const bool is_nbsp = (i + 1 < input.size() && ch == UTF8_NBSP_FIRST && static_cast<unsigned char>(input[i + 1]) == UTF8_NBSP_SECOND);
		if ((std::isspace(ch) != 0) || is_nbsp) {
			if (!prev_was_space) {
				result << ' ';
				prev_was_space = true;
			}
			if (is_nbsp) {
				++i; // Skip the second byte of the UTF-8 sequence.
			}
		} else {
			result << input[i];
			prev_was_space = false;
		}
	}
	return result.str();
}

std::string trim_string(const std::string& str) {
	auto start = str.begin();
	auto end = str.end();
	auto is_nbsp = [&](std::string::const_iterator it) -> bool {
		return it != str.end() && std::next(it) != str.end() && static_cast<unsigned char>(*it) == UTF8_NBSP_FIRST && static_cast<unsigned char>(*std::next(it)) == UTF8_NBSP_SECOND;
	};
	while (start != end && ((std::isspace(static_cast<unsigned char>(*start)) != 0) || is_nbsp(start))) {
		if (is_nbsp(start)) {
			start += 2;
		} else {
			++start;
		}
	}
	while (start != end) {
		auto prev = std::prev(end);
		if (std::isspace(static_cast<unsigned char>(*prev)) != 0) {
			end = prev;
		} else if (prev != start && is_nbsp(std::prev(prev))) {
			end = std::prev(prev);
		} else {
			break;
		}
	}
	return {start, end};
}

std::string remove_soft_hyphens(std::string_view input) {
	std::string result(input);
	const std::string sh = "\xC2\xAD";
	size_t pos = 0;
	while ((pos = result.find(sh, pos)) != std::string::npos) {
		result.erase(pos, sh.size());
	}
	return result;
}

std::string to_lower_ascii(std::string_view input) {
	std::string result;
	result.reserve(input.size());
	for (const char ch : input) {
		result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
	}
	return result;
}

// Splits class/id values such as "post-body main_ad" into {"post", "body", "main", "ad"}.
std::vector<std::string> split_identifier_tokens(std::string_view input) {
	std::vector<std::string> tokens;
	std::string current;
	for (const char ch : input) {
		const auto uch = static_cast<unsigned char>(ch);
		if (std::isalnum(uch) != 0) {
			current.push_back(static_cast<char>(std::tolower(uch)));
		} else if (!current.empty()) {
			tokens.push_back(std::move(current));
			current.clear();
		}
	}
	if (!current.empty()) {
		tokens.push_back(std::move(current));
	}
	return tokens;
}

size_t count_words(std::string_view text) noexcept {
	size_t count = 0;
	bool in_word = false;
	for (const char ch : text) {
		if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
			in_word = false;
		} else if (!in_word) {
			in_word = true;
			++count;
		}
	}
	return count;
}

size_t utf8_length(std::string_view text) {
	const wxString decoded = wxString::FromUTF8(text.data(), text.size());
	if (!decoded.empty() || text.empty()) {
		return decoded.length();
	}
	// Invalid UTF-8: count every byte that does not continue a sequence.
	size_t count = 0;
	for (const char ch : text) {
		if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
			++count;
		}
	}
	return count;
}

std::string convert_to_utf8(const std::string& input) {
	if (input.empty()) {
		return input;
	}
	const auto* data = reinterpret_cast<const unsigned char*>(input.data());
	const size_t len = input.length();
	auto try_convert = [&](size_t bom_size, const wxMBConv& conv) -> std::optional<std::string> {
		const wxString content(input.data() + bom_size, conv, len - bom_size);
		if (!content.empty()) {
			return content.utf8_string();
		}
		return std::nullopt;
	};
	if (len >= 4 && data[0] == 0xFF && data[1] == 0xFE && data[2] == 0x00 && data[3] == 0x00) {
		if (auto result = try_convert(4, wxMBConvUTF32LE{})) {
			return *result;
		}
	}
	if (len >= 4 && data[0] == 0x00 && data[1] == 0x00 && data[2] == 0xFE && data[3] == 0xFF) {
		if (auto result = try_convert(4, wxMBConvUTF32BE{})) {
			return *result;
		}
	}
	if (len >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
		return input.substr(3);
	}
	if (len >= 2 && data[0] == 0xFF && data[1] == 0xFE) {
		if (auto result = try_convert(2, wxMBConvUTF16LE{})) {
			return *result;
		}
	}
	if (len >= 2 && data[0] == 0xFE && data[1] == 0xFF) {
		if (auto result = try_convert(2, wxMBConvUTF16BE{})) {
			return *result;
		}
	}
	if (!wxString::FromUTF8(input.data(), len).empty()) {
		return input;
	}
	// Decoding never depends on the process locale.
	const std::pair<const char*, const wxMBConv*> fallback_encodings[] = {
		{"windows-1252", nullptr},
		{"iso-8859-1", &wxConvISO8859_1},
	};
	for (const auto& [name, conv] : fallback_encodings) {
		wxString content;
		if (conv != nullptr) {
			content = wxString(input.data(), *conv, len);
		} else {
			const wxCSConv csconv(name);
			content = wxString(input.data(), csconv, len);
		}
		if (!content.empty()) {
			return content.utf8_string();
		}
	}
	return input;
}

bool has_url_scheme(std::string_view url) noexcept {
	if (url.empty() || (std::isalpha(static_cast<unsigned char>(url[0])) == 0)) {
		return false;
	}
	for (size_t i = 1; i < url.size(); ++i) {
		const auto ch = static_cast<unsigned char>(url[i]);
		if (ch == ':') {
			return true;
		}
		if ((std::isalnum(ch) == 0) && ch != '+' && ch != '-' && ch != '.') {
			return false;
		}
	}
	return false;
}

std::string resolve_url(std::string_view base, std::string_view reference) {
	std::string ref = trim_string(std::string(reference));
	if (ref.empty() || has_url_scheme(ref) || !has_url_scheme(base)) {
		return ref;
	}
	const url_parts parts = split_url(base);
	if (!parts.has_authority) {
		return ref;
	}
	const std::string origin = parts.scheme + "://" + parts.authority;
	if (ref.starts_with("//")) {
		return parts.scheme + ":" + ref;
	}
	if (ref[0] == '#') {
		return origin + parts.path + parts.query + ref;
	}
	if (ref[0] == '?') {
		return origin + parts.path + ref;
	}
	const auto suffix_pos = ref.find_first_of("?#");
	const std::string ref_path = ref.substr(0, suffix_pos);
	const std::string suffix = suffix_pos == std::string::npos ? "" : ref.substr(suffix_pos);
	std::string merged;
	if (ref_path[0] == '/') {
		merged = ref_path;
	} else if (parts.path.empty()) {
		merged = "/" + ref_path;
	} else {
		merged = parts.path.substr(0, parts.path.rfind('/') + 1) + ref_path;
	}
	return origin + remove_dot_segments(merged) + suffix;
}
