/* test_markdown_generator_gtest.cpp - markdown rendering, citations and end to end generation tests.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "markdown_converter.hpp"
#include "markdown_generator.hpp"
#include "utils.hpp"
#include <gtest/gtest.h>
#include <string>

namespace {
std::string raw_markdown(const std::string& html, const std::string& url = {}) {
	return markdown_generator{}.generate(html, url).raw_markdown;
}

bool contains(const std::string& haystack, const std::string& needle) {
	return haystack.find(needle) != std::string::npos;
}

size_t occurrences(const std::string& haystack, const std::string& needle) {
	size_t count = 0;
	for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size())) {
		++count;
	}
	return count;
}
} // namespace

TEST(MarkdownGeneratorTest, PrunedPageKeepsArticleAndDropsNavigation) {
	const std::string html = "<nav>Home About</nav><article><h1>Title</h1><p>Real content here with more than five words.</p></article>";
	const markdown_result result = markdown_generator{}.generate(html, "", pruning_options{0.1, threshold_type::fixed, 5});
	ASSERT_TRUE(result.fit_markdown.has_value());
	ASSERT_TRUE(result.fit_html.has_value());
	EXPECT_TRUE(contains(*result.fit_markdown, "# Title"));
	EXPECT_TRUE(contains(*result.fit_markdown, "Real content here with more than five words."));
	EXPECT_FALSE(contains(*result.fit_markdown, "Home About"));
	EXPECT_FALSE(contains(result.raw_markdown, "Home About"));
	EXPECT_EQ(*result.fit_markdown, "# Title\n\nReal content here with more than five words.");
	ASSERT_TRUE(result.title.has_value());
	EXPECT_EQ(*result.title, "Title");
}

TEST(MarkdownGeneratorTest, Bm25KeepsOnlyRelevantBlock) {
	const std::string html = "<body><p>Today's weather forecast calls for rain</p><p>Contact us at support@example.com</p></body>";
	const markdown_result result = markdown_generator{}.generate(html, "", bm25_options{"weather forecast"});
	ASSERT_TRUE(result.fit_markdown.has_value());
	EXPECT_TRUE(contains(*result.fit_markdown, "weather forecast calls for rain"));
	EXPECT_FALSE(contains(*result.fit_markdown, "Contact us"));
	EXPECT_TRUE(contains(result.raw_markdown, "Contact us"));
}

TEST(MarkdownGeneratorTest, DuplicateUrlGivesOneCitation) {
	const markdown_result result = markdown_generator{}.generate("<body><p><a href=\"https://x.com\">X</a> and <a href=\"https://x.com\">X</a></p></body>");
	EXPECT_EQ(result.raw_markdown, "[X](https://x.com) and [X](https://x.com)");
	ASSERT_TRUE(result.references_markdown.has_value());
	EXPECT_EQ(*result.references_markdown, "## References\n\n[1] [X](https://x.com)");
	EXPECT_EQ(occurrences(*result.references_markdown, "https://x.com"), 1u);
}

TEST(MarkdownGeneratorTest, CitationsNumberedInFirstOccurrenceOrder) {
	const markdown_result result = markdown_generator{}.generate("<body><p><a href=\"/b\">Bee</a> <a href=\"/a\">Ay</a> <a href=\"/b\">Again</a></p></body>", "https://site.org/");
	ASSERT_TRUE(result.references_markdown.has_value());
	EXPECT_EQ(*result.references_markdown, "## References\n\n[1] [Bee](https://site.org/b)\n[2] [Ay](https://site.org/a)");
}

TEST(MarkdownGeneratorTest, NoLinksMeansNoReferences) {
	EXPECT_FALSE(markdown_generator{}.generate("<p>plain</p>").references_markdown.has_value());
}

TEST(MarkdownGeneratorTest, NoFilterSkipsFitOutput) {
	const markdown_result result = markdown_generator{}.generate("<body><p>One two three</p></body>", "", no_filter{});
	EXPECT_FALSE(result.fit_markdown.has_value());
	EXPECT_FALSE(result.fit_html.has_value());
	EXPECT_EQ(result.raw_markdown, "One two three");
	EXPECT_EQ(result.word_count(), 3u);
}

TEST(MarkdownGeneratorTest, WordCountFollowsFitMarkdown) {
	const std::string html = "<body><p>Today's weather forecast calls for rain</p><p>Contact us at support@example.com</p></body>";
	const markdown_result result = markdown_generator{}.generate(html, "", bm25_options{"weather forecast"});
	ASSERT_TRUE(result.fit_markdown.has_value());
	EXPECT_EQ(result.word_count(), count_words(*result.fit_markdown));
	EXPECT_NE(result.word_count(), count_words(result.raw_markdown));
}

TEST(MarkdownGeneratorTest, EmptyInputGivesEmptyResult) {
	const markdown_result plain = markdown_generator{}.generate("");
	EXPECT_EQ(plain.raw_markdown, "");
	EXPECT_FALSE(plain.title.has_value());
	EXPECT_FALSE(plain.fit_markdown.has_value());
	EXPECT_EQ(plain.word_count(), 0u);

	const markdown_result pruned = markdown_generator{}.generate("   ", "", pruning_options{});
	EXPECT_EQ(pruned.raw_markdown, "");
	ASSERT_TRUE(pruned.fit_markdown.has_value());
	ASSERT_TRUE(pruned.fit_html.has_value());
	EXPECT_EQ(*pruned.fit_markdown, "");
	EXPECT_EQ(*pruned.fit_html, "");
}

TEST(MarkdownGeneratorTest, GenerationIsIdempotent) {
	const std::string html = "<html><head><title>T</title></head><body><nav>n</nav><main><h2>Sub</h2><p>Alpha <a href=\"/x\">link</a> beta gamma delta epsilon.</p><ul><li>one</li><li>two</li></ul></main></body></html>";
	const markdown_generator generator;
	const filter_options options = pruning_options{0.48, threshold_type::dynamic, 2};
	EXPECT_EQ(generator.generate(html, "https://e.com/", options), generator.generate(html, "https://e.com/", options));
}

TEST(MarkdownGeneratorTest, RelativeLinksResolveAgainstPageUrl) {
	const std::string markdown = raw_markdown("<p>See <a href=\"../guide/intro.html\">the guide</a> now.</p>", "https://example.com/docs/page.html");
	EXPECT_EQ(markdown, "See [the guide](https://example.com/guide/intro.html) now.");
}

TEST(MarkdownGeneratorTest, NonNavigableAnchorsRenderAsText) {
	const markdown_result result = markdown_generator{}.generate("<p><a href=\"#top\">Top</a> <a href=\"javascript:void(0)\">Click</a> <a>Plain</a> <a href=\"/x\"> </a></p>");
	EXPECT_EQ(result.raw_markdown, "Top Click Plain");
	EXPECT_FALSE(result.references_markdown.has_value());
}

TEST(MarkdownGeneratorTest, HeadingsParagraphsAndRules) {
	EXPECT_EQ(raw_markdown("<h1>One</h1><h3>Three</h3><p>Text</p><hr><h6>Six</h6>"), "# One\n\n### Three\n\nText\n\n---\n\n###### Six");
}

TEST(MarkdownGeneratorTest, InlineFormatting) {
	EXPECT_EQ(raw_markdown("<p>Use <code>ls -la</code> and <strong>bold</strong> or <em>soft</em> <b> spaced </b>text.</p>"), "Use `ls -la` and **bold** or *soft* **spaced** text.");
}

TEST(MarkdownGeneratorTest, LineBreaksSplitLines) {
	EXPECT_EQ(raw_markdown("<p>first line<br>second line</p>"), "first line\nsecond line");
}

TEST(MarkdownGeneratorTest, NestedAndNumberedLists) {
	EXPECT_EQ(raw_markdown("<ul><li>One</li><li>Two<ul><li>Nested</li></ul></li></ul><ol start=\"3\"><li>Three</li><li>Four</li></ol>"), "- One\n- Two\n  - Nested\n\n3. Three\n4. Four");
}

TEST(MarkdownGeneratorTest, CodeBlocksKeepWhitespace) {
	const std::string markdown = raw_markdown("<pre><code class=\"language-cpp\">int x = 1;\n  return x;</code></pre>");
	EXPECT_EQ(markdown, "```cpp\nint x = 1;\n  return x;\n```");
}

TEST(MarkdownGeneratorTest, CodeBlockWithoutLanguage) {
	EXPECT_EQ(raw_markdown("<pre>a\n\n\nb</pre>"), "```\na\n\n\nb\n```");
}

TEST(MarkdownGeneratorTest, Blockquotes) {
	EXPECT_EQ(raw_markdown("<blockquote><p>First</p><p>Second</p></blockquote>"), "> First\n>\n> Second");
}

TEST(MarkdownGeneratorTest, TablesBecomePipeTables) {
	EXPECT_EQ(raw_markdown("<table><tr><th>Name</th><th>Age</th></tr><tr><td>Ann</td><td>30</td></tr><tr><td>B|C</td></tr></table>"), "| Name | Age |\n| --- | --- |\n| Ann | 30 |\n| B\\|C |  |");
}

TEST(MarkdownGeneratorTest, ImagesResolveAndSkipInlineData) {
	EXPECT_EQ(raw_markdown("<p><img src=\"/logo.png\" alt=\"Logo\"> <img src=\"data:image/png;base64,AAAA\" alt=\"Inline\"></p>", "https://example.com/"), "![Logo](https://example.com/logo.png) Inline");
}

TEST(MarkdownGeneratorTest, SpacesInUrlsAreEncoded) {
	EXPECT_EQ(raw_markdown("<p><a href=\"https://e.com/a b.html\">doc</a></p>"), "[doc](https://e.com/a%20b.html)");
}

TEST(MarkdownGeneratorTest, TitleFallsBackToTitleElement) {
	const markdown_result result = markdown_generator{}.generate("<html><head><title> Doc  Title </title></head><body><p>x</p></body></html>");
	ASSERT_TRUE(result.title.has_value());
	EXPECT_EQ(*result.title, "Doc Title");
	EXPECT_EQ(result.raw_markdown, "x");
	EXPECT_FALSE(markdown_generator{}.generate("<p>x</p>").title.has_value());
}

TEST(MarkdownGeneratorTest, CleanMarkdownCollapsesBlankLines) {
	EXPECT_EQ(clean_markdown("\n\nA  \n\n\n\nB\t\n\n"), "A\n\nB");
	EXPECT_EQ(clean_markdown(""), "");
}

TEST(MarkdownGeneratorTest, CleanMarkdownLeavesFencedCodeAlone) {
	const std::string fenced = "```\na  \n\n\n\nb\n```";
	EXPECT_EQ(clean_markdown(fenced), fenced);
}

TEST(MarkdownGeneratorTest, FindTitlePrefersMainContentHeading) {
	const html_normalizer normalizer;
	const normalized_page page = normalizer.normalize("<html><head><title>Site</title></head><body><header><h1>Logo</h1></header><main><h1>Article</h1></main></body></html>");
	const auto title = find_title(page.tree, page.content_root);
	ASSERT_TRUE(title.has_value());
	EXPECT_EQ(*title, "Article");
}

TEST(MarkdownGeneratorTest, CodeInsideListItemKeepsBlankLines) {
	const std::string markdown = raw_markdown("<ul><li><pre>a\n\n\nb</pre></li></ul><p>After</p>");
	EXPECT_EQ(markdown, "- ```\n  a\n\n\n  b\n  ```\n\nAfter");
}

TEST(MarkdownGeneratorTest, CodeInsideBlockquoteKeepsBlankLines) {
	EXPECT_EQ(raw_markdown("<blockquote><pre>a\n\n\nb</pre></blockquote>"), "> ```\n> a\n>\n>\n> b\n> ```");
}

TEST(MarkdownGeneratorTest, CodeContainingAFenceGetsALongerFence) {
	EXPECT_EQ(raw_markdown("<pre>x\n```\n\n\ny</pre>"), "````\nx\n```\n\n\ny\n````");
}

TEST(MarkdownGeneratorTest, CleanMarkdownResumesAfterNestedFence) {
	EXPECT_EQ(clean_markdown("- ```\n  a\n\n\n  b\n  ```\n\nAfter\n\n\n\nTail   "), "- ```\n  a\n\n\n  b\n  ```\n\nAfter\n\nTail");
	EXPECT_EQ(clean_markdown("````\nx\n```\n\n\ny\n````\n\n\nz  "), "````\nx\n```\n\n\ny\n````\n\nz");
}

TEST(MarkdownGeneratorTest, PrunedListKeepsItsMarkers) {
	const std::string html = "<body><ul><li>First item has enough words here</li><li>Second item also has enough words</li></ul><ol start=\"4\"><li>Alpha beta gamma delta</li><li>Epsilon zeta eta theta</li></ol></body>";
	const markdown_result result = markdown_generator{}.generate(html, "", pruning_options{0.1, threshold_type::fixed, 3});
	ASSERT_TRUE(result.has_fit());
	EXPECT_EQ(*result.fit_markdown, "- First item has enough words here\n\n- Second item also has enough words\n\n4. Alpha beta gamma delta\n\n5. Epsilon zeta eta theta");
}

TEST(MarkdownGeneratorTest, PrunedTableStaysATable) {
	const std::string html = "<body><table><tr><th>Name</th><th>Age</th></tr><tr><td>Ann</td><td>30</td></tr></table></body>";
	const markdown_result result = markdown_generator{}.generate(html, "", pruning_options{0.1, threshold_type::fixed, 0});
	ASSERT_TRUE(result.has_fit());
	EXPECT_EQ(*result.fit_markdown, "| Name | Age |\n| --- | --- |\n| Ann | 30 |");
}

TEST(MarkdownGeneratorTest, SingleByteEncodedPageSurvivesPruning) {
	const std::string html = "<body><p>Caf\xE9 owners say the new espresso machine brews much faster than the old one did.</p></body>";
	const markdown_result result = markdown_generator{}.generate(html, "", pruning_options{0.48, threshold_type::fixed, 5});
	EXPECT_EQ(result.raw_markdown, "Caf\xC3\xA9 owners say the new espresso machine brews much faster than the old one did.");
	ASSERT_TRUE(result.has_fit());
	EXPECT_EQ(*result.fit_markdown, result.raw_markdown);
}

TEST(MarkdownGeneratorTest, SingleByteEncodedPageMatchesQuery) {
	const std::string html = "<body><p>Le caf\xE9 du matin est servi tr\xE8s chaud</p><p>Contact the support desk today</p></body>";
	for (const std::string query : {"caf\xC3\xA9 matin", "caf\xE9 matin"}) {
		const markdown_result result = markdown_generator{}.generate(html, "", bm25_options{query});
		ASSERT_TRUE(result.has_fit());
		EXPECT_EQ(*result.fit_markdown, "Le caf\xC3\xA9 du matin est servi tr\xC3\xA8s chaud");
	}
}

TEST(MarkdownGeneratorTest, ReferencesStopAtTheCitationLimit) {
	std::string html = "<body><p>";
	for (size_t i = 1; i <= MAX_CITATIONS + 5; ++i) {
		html += "<a href=\"https://e.com/" + std::to_string(i) + "\">link" + std::to_string(i) + "</a> ";
	}
	html += "</p></body>";
	const markdown_result result = markdown_generator{}.generate(html);
	ASSERT_TRUE(result.references_markdown.has_value());
	EXPECT_EQ(occurrences(*result.references_markdown, "\n["), MAX_CITATIONS);
	EXPECT_TRUE(contains(*result.references_markdown, "[50] [link50](https://e.com/50)"));
	EXPECT_FALSE(contains(*result.references_markdown, "https://e.com/51"));
	EXPECT_TRUE(contains(result.raw_markdown, "[link55](https://e.com/55)"));
}
