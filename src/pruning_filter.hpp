/* pruning_filter.hpp - query-free boilerplate scoring header file.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "content_block.hpp"
#include "filter_options.hpp"
#include <string_view>
#include <vector>

// Composite score: 0.25 text density, 0.25 link-free share, 0.2 tag weight, 0.2 length, 0.1 class/id evidence.
[[nodiscard]] double score_block(const content_block& block);
[[nodiscard]] double tag_weight(std::string_view tag) noexcept;
[[nodiscard]] double length_score(std::string_view tag, size_t text_length) noexcept;

// Positive minus negative class/id patterns found in a lowercased context string, clamped to [-3, 1].
[[nodiscard]] double class_id_score(std::string_view context);

// Cutoff applied to already scored blocks. Blocks under the word floor never count toward the dynamic maximum.
[[nodiscard]] double pruning_cutoff(const std::vector<content_block>& blocks, const pruning_options& options);
void apply_pruning_threshold(std::vector<content_block>& blocks, const pruning_options& options);
void apply_pruning(std::vector<content_block>& blocks, const pruning_options& options);
