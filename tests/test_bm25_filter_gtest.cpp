/* test_bm25_filter_gtest.cpp - tokenization, BM25 ranking, fallback and query derivation tests.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "bm25_filter.hpp"
#include "content_block.hpp"
#include "content_filter.hpp"
#include "dom_tree.hpp"
#include "html_normalizer.hpp"
#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {
std::vector<content_block> text_blocks(const std::vector<std::string>& texts, const std::string& tag = "p") {
	std::vector<content_block> blocks(texts.size());
	for (size_t i = 0; i < texts.size(); ++i) {
		blocks[i].text = texts[i];
		blocks[i].tag = tag;
	}
	return blocks;
}

std::vector<bool> retained_flags(const std::vector<content_block>& blocks) {
	std::vector<bool> flags;
	flags.reserve(blocks.size());
	for (const auto& block : blocks) {
		flags.push_back(block.retained);
	}
	return flags;
}
} // namespace

TEST(Bm25FilterTest, TokenizeLowercasesAndDropsShortTokens) {
	const std::vector<std::string> expected{"hello", "world", "b2", "c3po"};
	EXPECT_EQ(tokenize_for_bm25("Hello, World! a b2 x C3PO"), expected);
	EXPECT_TRUE(tokenize_for_bm25("").empty());
	EXPECT_TRUE(tokenize_for_bm25("a b c - !").empty());
}

TEST(Bm25FilterTest, TokenizeSplitsOnPunctuation) {
	const std::vector<std::string> expected{"support", "example", "com"};
	EXPECT_EQ(tokenize_for_bm25("support@example.com"), expected);
}

TEST(Bm25FilterTest, TokenizeFoldsNonAsciiLetters) {
	const std::vector<std::string> expected{"café", "résumé", "straße", "ärger", "αθηνα", "łódź"};
	EXPECT_EQ(tokenize_for_bm25("Café RÉSUMÉ Straße «Ärger» ΑΘΗΝΑ ŁÓDŹ"), expected);
}

TEST(Bm25FilterTest, IdfFollowsOkapiFormula) {
	const std::vector<std::vector<std::string>> documents{{"alpha", "beta"}, {"beta"}};
	const bm25_index index{documents, 1.2, 0.75};
	EXPECT_EQ(index.size(), 2u);
	EXPECT_NEAR(index.idf("alpha"), std::log(2.0), 1e-12);
	EXPECT_NEAR(index.idf("beta"), std::log(1.2), 1e-12);
}

TEST(Bm25FilterTest, BlockWithAllQueryTermsBeatsBlockWithNone) {
	const std::vector<std::vector<std::string>> documents{
		tokenize_for_bm25("weather forecast weather forecast rain today"),
		tokenize_for_bm25("contact support email address phone office"),
		tokenize_for_bm25("opening hours are listed below for visitors"),
	};
	const bm25_index index{documents, 1.2, 0.75};
	const auto scores = index.scores(tokenize_for_bm25("weather forecast"));
	ASSERT_EQ(scores.size(), 3u);
	EXPECT_GT(scores[0], scores[1]);
	EXPECT_DOUBLE_EQ(scores[1], 0.0);
	EXPECT_DOUBLE_EQ(scores[2], 0.0);
}

TEST(Bm25FilterTest, UnknownQueryTermsScoreZero) {
	const std::vector<std::vector<std::string>> documents{tokenize_for_bm25("alpha"), tokenize_for_bm25("beta")};
	const bm25_index index{documents, 1.2, 0.75};
	const auto scores = index.scores(tokenize_for_bm25("gamma"));
	EXPECT_DOUBLE_EQ(scores[0], 0.0);
	EXPECT_DOUBLE_EQ(scores[1], 0.0);
}

TEST(Bm25FilterTest, RelevantBlockRetainedIrrelevantDropped) {
	auto blocks = text_blocks({"Today's weather forecast calls for rain", "Contact us at support@example.com"});
	select_bm25_blocks(blocks, bm25_options{"weather forecast"});
	EXPECT_TRUE(blocks[0].retained);
	EXPECT_FALSE(blocks[1].retained);
	EXPECT_GE(blocks[0].score, 1.0);
}

TEST(Bm25FilterTest, PriorityTagsMultiplyScores) {
	EXPECT_DOUBLE_EQ(bm25_priority_weight("h1"), 5.0);
	EXPECT_DOUBLE_EQ(bm25_priority_weight("h2"), 4.0);
	EXPECT_DOUBLE_EQ(bm25_priority_weight("blockquote"), 2.0);
	EXPECT_DOUBLE_EQ(bm25_priority_weight("th"), 1.5);
	EXPECT_DOUBLE_EQ(bm25_priority_weight("p"), 1.0);

	auto plain = text_blocks({"solar panels on roofs", "unrelated words here"});
	auto heading = text_blocks({"solar panels on roofs", "unrelated words here"}, "h2");
	select_bm25_blocks(plain, bm25_options{"solar", 0.0});
	select_bm25_blocks(heading, bm25_options{"solar", 0.0});
	EXPECT_NEAR(heading[0].score, plain[0].score * 4.0, 1e-9);
}

TEST(Bm25FilterTest, FallbackKeepsThreeBestInDocumentOrder) {
	ASSERT_EQ(BM25_FALLBACK_BLOCKS, 3u);
	auto blocks = text_blocks({
		"alpha beta gamma delta",
		"term filler filler filler",
		"term term filler filler",
		"term term term filler",
		"term term term term",
	});
	select_bm25_blocks(blocks, bm25_options{"term", 100.0});
	const std::vector<bool> expected{false, false, true, true, true};
	EXPECT_EQ(retained_flags(blocks), expected);
}

TEST(Bm25FilterTest, FallbackNeverKeepsZeroScores) {
	auto blocks = text_blocks({
		"term appears here once",
		"nothing relevant at all",
		"still nothing relevant",
		"term appears again here",
		"more unrelated words",
	});
	select_bm25_blocks(blocks, bm25_options{"term", 100.0});
	const std::vector<bool> expected{true, false, false, true, false};
	EXPECT_EQ(retained_flags(blocks), expected);
}

TEST(Bm25FilterTest, EmptyQueryRetainsNothing) {
	auto blocks = text_blocks({"some text", "more text"});
	select_bm25_blocks(blocks, bm25_options{""});
	EXPECT_EQ(retained_flags(blocks), (std::vector<bool>{false, false}));
}

TEST(Bm25FilterTest, DerivePageQueryPrefersTitle) {
	const dom_tree tree = dom_tree::parse("<html><head><title>Page Title</title><meta name=\"description\" content=\"Desc\"></head><body><h1>Heading</h1></body></html>");
	EXPECT_EQ(derive_page_query(tree), "Page Title");
}

TEST(Bm25FilterTest, DerivePageQueryFallsThroughMetadata) {
	EXPECT_EQ(derive_page_query(dom_tree::parse("<html><head><meta name=\"Description\" content=\" The description \"><meta name=\"keywords\" content=\"k1, k2\"></head><body></body></html>")), "The description");
	EXPECT_EQ(derive_page_query(dom_tree::parse("<html><head><meta name=\"keywords\" content=\"k1, k2\"></head><body><h1>Heading</h1></body></html>")), "k1, k2");
	EXPECT_EQ(derive_page_query(dom_tree::parse("<body><p>short</p><h1>Main heading</h1></body>")), "Main heading");
}

TEST(Bm25FilterTest, DerivePageQueryUsesFirstLongParagraph) {
	const std::string long_text(250, 'x');
	const dom_tree tree = dom_tree::parse("<body><p>Too short to count.</p><p>" + long_text + "</p></body>");
	EXPECT_EQ(derive_page_query(tree), std::string(200, 'x'));
	EXPECT_EQ(derive_page_query(dom_tree::parse("<body><p>tiny</p></body>")), "");
	EXPECT_EQ(derive_page_query(dom_tree{}), "");
}

TEST(Bm25FilterTest, ApplyBm25DerivesQueryFromTitle) {
	const normalized_page page = html_normalizer{}.normalize("<html><head><title>weather forecast</title></head><body><p>Today's weather forecast calls for rain</p><p>Contact us at support@example.com</p></body></html>");
	const filter_result result = run_content_filter(page, bm25_options{});
	ASSERT_EQ(result.blocks.size(), 2u);
	EXPECT_TRUE(result.blocks[0].retained);
	EXPECT_FALSE(result.blocks[1].retained);
}

TEST(Bm25FilterTest, ApplyBm25WithoutAnyQueryRetainsNothing) {
	const normalized_page page = html_normalizer{}.normalize("<body><p>tiny</p><p>words</p></body>");
	const filter_result result = run_content_filter(page, bm25_options{});
	EXPECT_TRUE(result.fit_requested);
	EXPECT_EQ(result.retained_count(), 0u);
}
