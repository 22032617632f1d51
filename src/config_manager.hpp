/* config_manager.hpp - config management header file.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "filter_options.hpp"
#include <functional>
#include <memory>
#include <string>
#include <wx/fileconf.h>
#include <wx/string.h>

template <typename T>
struct app_setting {
	const char* key;
	T default_value;

	constexpr app_setting(const char* k, const T& def) : key{k}, default_value{def} {
	}
};

class config_manager {
public:
	static constexpr app_setting<double> pruning_threshold{"pruning_threshold", 0.48};
	static constexpr app_setting<bool> pruning_dynamic{"pruning_dynamic", true};
	static constexpr app_setting<int> min_word_threshold{"min_word_threshold", 5};
	static constexpr app_setting<double> bm25_threshold{"bm25_threshold", 1.0};
	static constexpr app_setting<double> bm25_k1{"bm25_k1", 1.2};
	static constexpr app_setting<double> bm25_b{"bm25_b", 0.75};
	static constexpr app_setting<int> config_version{"version", 0};

	config_manager() = default;
	~config_manager();
	config_manager(const config_manager&) = delete;
	config_manager& operator=(const config_manager&) = delete;
	config_manager(config_manager&&) = default;
	config_manager& operator=(config_manager&&) = default;

	// Opens the INI file at path, or the per-user default location when path is empty.
	bool initialize(const wxString& path = wxEmptyString);
	void flush();
	void shutdown();

	[[nodiscard]] wxFileConfig* get_config() const {
		return config.get();
	}

	[[nodiscard]] bool is_initialized() const {
		return config != nullptr;
	}

	[[nodiscard]] const wxString& get_path() const noexcept {
		return path;
	}

	template <typename T>
	[[nodiscard]] T get(const app_setting<T>& setting) const {
		return get_app_setting(wxString(setting.key), setting.default_value);
	}

	template <typename T>
	void set(const app_setting<T>& setting, const T& value) {
		set_app_setting(wxString(setting.key), value);
	}

	[[nodiscard]] pruning_options get_pruning_options() const;
	[[nodiscard]] bm25_options get_bm25_options(const std::string& query) const;

	[[nodiscard]] static wxString get_default_config_path();

private:
	std::unique_ptr<wxFileConfig> config;
	wxString path;

	template <typename T>
	T get_app_setting(const wxString& key, const T& default_value) const;
	template <typename T>
	void set_app_setting(const wxString& key, const T& value);
	void load_defaults();
	void with_app_section(const std::function<void()>& func) const;
};
