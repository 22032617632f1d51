/* cleaning_policy.hpp - constant tables deciding what the normalizer strips and keeps.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "dom_tree.hpp"
#include <span>
#include <string>
#include <string_view>

enum class selector_kind {
	tag,
	id,
	class_name,
	attribute_equals
};

// The subset of CSS selectors the policy needs: "main", "#content", ".menu", "[role=main]".
struct simple_selector {
	selector_kind kind;
	std::string_view name;
	std::string_view value{};
};

struct cleaning_policy {
	std::span<const std::string_view> removal_tags;
	std::span<const std::string_view> unwrap_tags;
	std::span<const simple_selector> main_content_selectors;
	std::span<const simple_selector> fallback_removal_selectors;

	[[nodiscard]] bool is_removal_tag(std::string_view tag) const noexcept;
	[[nodiscard]] bool is_unwrap_tag(std::string_view tag) const noexcept;
	[[nodiscard]] static bool is_hidden(const dom_node& node);
	[[nodiscard]] static const cleaning_policy& defaults() noexcept;
};

[[nodiscard]] bool matches_selector(const dom_node& node, const simple_selector& selector);
[[nodiscard]] std::string selector_to_string(const simple_selector& selector);
