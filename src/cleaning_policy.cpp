/* cleaning_policy.cpp - the default cleaning tables and selector matching.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "cleaning_policy.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>

namespace {
constexpr std::array<std::string_view, 13> REMOVAL_TAGS = {
	"script",
	"style",
	"noscript",
	"iframe",
	"svg",
	"canvas",
	"video",
	"audio",
	"form",
	"input",
	"button",
	"select",
	"textarea",
};

constexpr std::array<std::string_view, 7> UNWRAP_TAGS = {"span", "font", "b", "i", "u", "strong", "em"};

constexpr std::array MAIN_CONTENT_SELECTORS = {
	simple_selector{selector_kind::tag, "main"},
	simple_selector{selector_kind::tag, "article"},
	simple_selector{selector_kind::attribute_equals, "role", "main"},
	simple_selector{selector_kind::id, "id", "content"},
	simple_selector{selector_kind::class_name, "class", "content"},
	simple_selector{selector_kind::id, "id", "main"},
	simple_selector{selector_kind::class_name, "class", "main"},
};

constexpr std::array FALLBACK_REMOVAL_SELECTORS = {
	simple_selector{selector_kind::tag, "nav"},
	simple_selector{selector_kind::tag, "header"},
	simple_selector{selector_kind::tag, "footer"},
	simple_selector{selector_kind::tag, "aside"},
	simple_selector{selector_kind::class_name, "class", "sidebar"},
	simple_selector{selector_kind::id, "id", "sidebar"},
	simple_selector{selector_kind::class_name, "class", "nav"},
	simple_selector{selector_kind::class_name, "class", "menu"},
};

bool has_class(const dom_node& node, std::string_view class_name) {
	const auto classes = node.attribute("class");
	if (!classes) {
		return false;
	}
	size_t pos = 0;
	while (pos < classes->size()) {
		while (pos < classes->size() && std::isspace(static_cast<unsigned char>((*classes)[pos])) != 0) {
			++pos;
		}
		size_t end = pos;
		while (end < classes->size() && std::isspace(static_cast<unsigned char>((*classes)[end])) == 0) {
			++end;
		}
		if (end > pos && classes->substr(pos, end - pos) == class_name) {
			return true;
		}
		pos = end;
	}
	return false;
}
} // namespace

bool cleaning_policy::is_removal_tag(std::string_view tag) const noexcept {
	return std::find(removal_tags.begin(), removal_tags.end(), tag) != removal_tags.end();
}

bool cleaning_policy::is_unwrap_tag(std::string_view tag) const noexcept {
	return std::find(unwrap_tags.begin(), unwrap_tags.end(), tag) != unwrap_tags.end();
}

bool cleaning_policy::is_hidden(const dom_node& node) {
	if (!node.is_element()) {
		return false;
	}
	if (node.has_attribute("hidden")) {
		return true;
	}
	const auto aria_hidden = node.attribute("aria-hidden");
	if (aria_hidden && *aria_hidden == "true") {
		return true;
	}
	const auto style = node.attribute("style");
	if (!style) {
		return false;
	}
	std::string compact;
	compact.reserve(style->size());
	for (const char ch : *style) {
		if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
			compact.push_back(ch);
		}
	}
	return to_lower_ascii(compact).find("display:none") != std::string::npos;
}

const cleaning_policy& cleaning_policy::defaults() noexcept {
	static const cleaning_policy policy{REMOVAL_TAGS, UNWRAP_TAGS, MAIN_CONTENT_SELECTORS, FALLBACK_REMOVAL_SELECTORS};
	return policy;
}

bool matches_selector(const dom_node& node, const simple_selector& selector) {
	if (!node.is_element()) {
		return false;
	}
	switch (selector.kind) {
		case selector_kind::tag:
			return node.tag == selector.name;
		case selector_kind::class_name:
			return has_class(node, selector.value);
		case selector_kind::id:
		case selector_kind::attribute_equals: {
			const auto value = node.attribute(selector.name);
			return value && *value == selector.value;
		}
	}
	return false;
}

std::string selector_to_string(const simple_selector& selector) {
	switch (selector.kind) {
		case selector_kind::tag:
			return std::string(selector.name);
		case selector_kind::id:
			return "#" + std::string(selector.value);
		case selector_kind::class_name:
			return "." + std::string(selector.value);
		case selector_kind::attribute_equals:
			return "[" + std::string(selector.name) + "=" + std::string(selector.value) + "]";
	}
	return {};
}
