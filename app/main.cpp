/* main.cpp - command line entry point: reads a saved page and prints its markdown.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "constants.hpp"
#include "filter_options.hpp"
#include "markdown_generator.hpp"
#include <cstdio>
#include <exception>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <wx/cmdline.h>
#include <wx/ffile.h>
#include <wx/init.h>
#include <wx/log.h>
#include <wx/string.h>

namespace {
const wxCmdLineEntryDesc command_line_desc[] = {
	{wxCMD_LINE_SWITCH, "h", "help", "show this help message", wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP},
	{wxCMD_LINE_OPTION, "u", "url", "URL the page was fetched from, used to resolve relative links", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, "q", "query", "keep only the blocks relevant to this query (BM25)", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_SWITCH, "r", "raw", "print the unfiltered markdown", wxCMD_LINE_VAL_NONE, 0},
	{wxCMD_LINE_SWITCH, "t", "text", "print plain text instead of markdown", wxCMD_LINE_VAL_NONE, 0},
	{wxCMD_LINE_SWITCH, nullptr, "fixed", "use a fixed instead of a dynamic pruning threshold", wxCMD_LINE_VAL_NONE, 0},
	{wxCMD_LINE_OPTION, nullptr, "threshold", "pruning or BM25 threshold", wxCMD_LINE_VAL_DOUBLE, 0},
	{wxCMD_LINE_OPTION, nullptr, "min-words", "drop pruned blocks with fewer words", wxCMD_LINE_VAL_NUMBER, 0},
	{wxCMD_LINE_SWITCH, nullptr, "references", "append the numbered link references", wxCMD_LINE_VAL_NONE, 0},
	{wxCMD_LINE_SWITCH, nullptr, "fit-html", "print the filtered HTML instead of markdown", wxCMD_LINE_VAL_NONE, 0},
	{wxCMD_LINE_OPTION, "c", "config", "configuration file to use", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_SWITCH, "v", "verbose", "log progress to stderr", wxCMD_LINE_VAL_NONE, 0},
	{wxCMD_LINE_PARAM, nullptr, nullptr, "input file, stdin when omitted", wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL},
	{wxCMD_LINE_NONE, nullptr, nullptr, nullptr, wxCMD_LINE_VAL_NONE, 0},
};

std::optional<std::string> read_input(const wxCmdLineParser& parser) {
	if (parser.GetParamCount() == 0) {
		std::ostringstream oss;
		oss << std::cin.rdbuf();
		return oss.str();
	}
	const wxString path = parser.GetParam(0);
	wxFFile file;
	if (!file.Open(path, "rb")) {
		wxLogError("Could not open %s", path);
		return std::nullopt;
	}
	std::string content;
	const wxFileOffset length = file.Length();
	if (length > 0) {
		content.resize(static_cast<size_t>(length));
		if (file.Read(content.data(), content.size()) != content.size()) {
			wxLogError("Could not read %s", path);
			return std::nullopt;
		}
	}
	return content;
}

filter_options build_filter_options(const wxCmdLineParser& parser, const config_manager& config) {
	wxString query;
	if (parser.Found("q", &query) && !query.IsEmpty()) {
		bm25_options options = config.get_bm25_options(query.utf8_string());
		double threshold = 0.0;
		if (parser.Found("threshold", &threshold)) {
			options.threshold = threshold;
		}
		return options;
	}
	if (parser.Found("r")) {
		return no_filter{};
	}
	pruning_options options = config.get_pruning_options();
	if (parser.Found("fixed")) {
		options.type = threshold_type::fixed;
	}
	double threshold = 0.0;
	if (parser.Found("threshold", &threshold)) {
		options.threshold = threshold;
	}
	long min_words = 0;
	if (parser.Found("min-words", &min_words)) {
		options.min_word_threshold = static_cast<int>(min_words);
	}
	return options;
}

std::string render_output(const markdown_result& result, const wxCmdLineParser& parser) {
	if (parser.Found("fit-html")) {
		return result.fit_html.value_or(std::string{});
	}
	std::string markdown = result.has_fit() ? *result.fit_markdown : result.raw_markdown;
	if (result.title) {
		const std::string heading = "# " + *result.title;
		if (!markdown.starts_with(heading)) {
			markdown = markdown.empty() ? heading : heading + "\n\n" + markdown;
		}
	}
	if (parser.Found("references") && result.references_markdown) {
		markdown += "\n\n" + *result.references_markdown;
	}
	return markdown;
}
} // namespace

int main(int argc, char** argv) {
	wxInitializer initializer(argc, argv);
	if (!initializer.IsOk()) {
		std::fputs("Failed to initialize wxWidgets\n", stderr);
		return 1;
	}
	delete wxLog::SetActiveTarget(new wxLogStderr(stderr));
	wxCmdLineParser parser(command_line_desc, argc, argv);
	parser.SetLogo(APP_NAME + " " + APP_VERSION + " - " + APP_DESCRIPTION);
	switch (parser.Parse()) {
		case -1:
			return 0;
		case 0:
			break;
		default:
			return 1;
	}
	if (parser.Found("v")) {
		wxLog::SetVerbose(true);
	}
	const auto input = read_input(parser);
	if (!input) {
		return 1;
	}
	const markdown_generator generator;
	if (parser.Found("t")) {
		try {
			std::cout << generator.get_normalizer().extract_text(*input) << '\n';
		} catch (const std::exception& e) {
			wxLogError("Text extraction failed: %s", wxString::FromUTF8(e.what()));
			return 1;
		}
		return 0;
	}
	config_manager config;
	wxString config_path;
	parser.Found("c", &config_path);
	if (!config.initialize(config_path)) {
		wxLogError("Failed to initialize configuration");
		return 1;
	}
	wxString url;
	parser.Found("u", &url);
	const markdown_result result = generator.generate(*input, url.utf8_string(), build_filter_options(parser, config));
	config.shutdown();
	std::cout << render_output(result, parser) << '\n';
	return 0;
}
