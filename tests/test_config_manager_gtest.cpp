/* test_config_manager_gtest.cpp - INI backed settings tests.
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
#include <gtest/gtest.h>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/log.h>

namespace {
class ConfigManagerTest : public ::testing::Test {
protected:
	void SetUp() override {
		path = wxFileName::CreateTempFileName("pagemark");
		ASSERT_FALSE(path.IsEmpty());
		ASSERT_TRUE(config.initialize(path));
	}

	void TearDown() override {
		config.shutdown();
		if (wxFileExists(path)) {
			wxRemoveFile(path);
		}
	}

	wxString path;
	config_manager config;
};
} // namespace

TEST_F(ConfigManagerTest, FreshFileGivesDefaults) {
	EXPECT_TRUE(config.is_initialized());
	EXPECT_EQ(config.get_path(), path);
	const pruning_options pruning = config.get_pruning_options();
	EXPECT_DOUBLE_EQ(pruning.threshold, 0.48);
	EXPECT_EQ(pruning.type, threshold_type::dynamic);
	EXPECT_EQ(pruning.min_word_threshold, 5);
	const bm25_options bm25 = config.get_bm25_options("query");
	EXPECT_EQ(bm25.query, "query");
	EXPECT_DOUBLE_EQ(bm25.threshold, 1.0);
	EXPECT_DOUBLE_EQ(bm25.k1, 1.2);
	EXPECT_DOUBLE_EQ(bm25.b, 0.75);
	EXPECT_EQ(config.get(config_manager::config_version), CONFIG_VERSION_CURRENT);
}

TEST_F(ConfigManagerTest, ValuesSurviveReopening) {
	config.set(config_manager::pruning_threshold, 0.3);
	config.set(config_manager::pruning_dynamic, false);
	config.set(config_manager::min_word_threshold, 9);
	config.shutdown();
	EXPECT_FALSE(config.is_initialized());

	config_manager reopened;
	ASSERT_TRUE(reopened.initialize(path));
	const pruning_options pruning = reopened.get_pruning_options();
	EXPECT_DOUBLE_EQ(pruning.threshold, 0.3);
	EXPECT_EQ(pruning.type, threshold_type::fixed);
	EXPECT_EQ(pruning.min_word_threshold, 9);
	reopened.shutdown();
}

TEST_F(ConfigManagerTest, InvalidNumberFallsBackToDefault) {
	config.get_config()->Write("/app/bm25_k1", "not-a-number");
	const wxLogNull suppress;
	EXPECT_DOUBLE_EQ(config.get(config_manager::bm25_k1), 1.2);
}

TEST_F(ConfigManagerTest, StoredValuesAreClamped) {
	config.set(config_manager::min_word_threshold, -4);
	config.set(config_manager::bm25_b, 3.0);
	config.set(config_manager::bm25_threshold, -1.0);
	EXPECT_EQ(config.get_pruning_options().min_word_threshold, 0);
	const bm25_options bm25 = config.get_bm25_options("");
	EXPECT_DOUBLE_EQ(bm25.b, 1.0);
	EXPECT_DOUBLE_EQ(bm25.threshold, 0.0);
}
