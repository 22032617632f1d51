/* config_manager.cpp - manages reading from and writing to our INI-based config file.
 *
 * Pagemark.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "constants.hpp"
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/stdpaths.h>

namespace {
inline bool read_config_value(wxFileConfig* cfg, const wxString& key, bool default_val) {
	return cfg->ReadBool(key, default_val);
}

inline int read_config_value(wxFileConfig* cfg, const wxString& key, int default_val) {
	return static_cast<int>(cfg->ReadLong(key, default_val));
}

// Doubles are kept as C-locale strings so the file reads the same on every system.
inline double read_config_value(wxFileConfig* cfg, const wxString& key, double default_val) {
	const wxString raw = cfg->Read(key, wxEmptyString);
	double value = default_val;
	if (raw.IsEmpty() || !raw.ToCDouble(&value)) {
		if (!raw.IsEmpty()) {
			wxLogWarning("Ignoring invalid number '%s' for setting '%s'", raw, key);
		}
		return default_val;
	}
	return value;
}

inline void write_config_value(wxFileConfig* cfg, const wxString& key, bool value) {
	cfg->Write(key, value);
}

inline void write_config_value(wxFileConfig* cfg, const wxString& key, int value) {
	cfg->Write(key, static_cast<long>(value));
}

inline void write_config_value(wxFileConfig* cfg, const wxString& key, double value) {
	cfg->Write(key, wxString::FromCDouble(value));
}
} // namespace

config_manager::~config_manager() {
	if (config) {
		shutdown();
	}
}

bool config_manager::initialize(const wxString& config_path) {
	path = config_path.IsEmpty() ? get_default_config_path() : config_path;
	config = std::make_unique<wxFileConfig>(APP_NAME, "", path, "", wxCONFIG_USE_LOCAL_FILE);
	if (!config) {
		return false;
	}
	wxLogVerbose("Using configuration file %s", path);
	load_defaults();
	return true;
}

void config_manager::flush() {
	if (!config) {
		return;
	}
	config->Flush();
}

void config_manager::shutdown() {
	if (!config) {
		return;
	}
	config->Flush();
	config.reset();
}

pruning_options config_manager::get_pruning_options() const {
	pruning_options options;
	options.threshold = get(pruning_threshold);
	options.type = get(pruning_dynamic) ? threshold_type::dynamic : threshold_type::fixed;
	options.min_word_threshold = get(min_word_threshold);
	return clamp_options(options);
}

bm25_options config_manager::get_bm25_options(const std::string& query) const {
	bm25_options options;
	options.query = query;
	options.threshold = get(bm25_threshold);
	options.k1 = get(bm25_k1);
	options.b = get(bm25_b);
	return clamp_options(options);
}

wxString config_manager::get_default_config_path() {
	const wxString config_dir = wxStandardPaths::Get().GetUserDataDir();
	if (!wxFileName::DirExists(config_dir)) {
		wxFileName::Mkdir(config_dir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL);
	}
	return config_dir + wxFileName::GetPathSeparator() + CONFIG_FILE_NAME;
}

template <typename T>
T config_manager::get_app_setting(const wxString& key, const T& default_value) const {
	T result = default_value;
	with_app_section([this, &key, &default_value, &result]() {
		result = read_config_value(config.get(), key, default_value);
	});
	return result;
}

template <typename T>
void config_manager::set_app_setting(const wxString& key, const T& value) {
	with_app_section([this, &key, &value]() {
		write_config_value(config.get(), key, value);
	});
}

void config_manager::load_defaults() {
	auto set_default_if_missing = [this](const auto& setting) {
		config->SetPath("/app");
		if (!config->HasEntry(setting.key)) {
			write_config_value(config.get(), setting.key, setting.default_value);
		}
		config->SetPath("/");
	};
	set_default_if_missing(pruning_threshold);
	set_default_if_missing(pruning_dynamic);
	set_default_if_missing(min_word_threshold);
	set_default_if_missing(bm25_threshold);
	set_default_if_missing(bm25_k1);
	set_default_if_missing(bm25_b);
	if (get(config_version) != CONFIG_VERSION_CURRENT) {
		set(config_version, CONFIG_VERSION_CURRENT);
	}
}

void config_manager::with_app_section(const std::function<void()>& func) const {
	if (!config) {
		return;
	}
	config->SetPath("/app");
	func();
	config->SetPath("/");
}

template bool config_manager::get_app_setting<bool>(const wxString&, const bool&) const;
template int config_manager::get_app_setting<int>(const wxString&, const int&) const;
template double config_manager::get_app_setting<double>(const wxString&, const double&) const;
template void config_manager::set_app_setting<bool>(const wxString&, const bool&);
template void config_manager::set_app_setting<int>(const wxString&, const int&);
template void config_manager::set_app_setting<double>(const wxString&, const double&);
