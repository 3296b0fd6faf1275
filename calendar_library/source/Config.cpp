// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "UtcTimeKit/calendar/Config.hpp"

#include <cstdlib>
#include <mutex>

#ifndef UTK_LOCALE_DATA_DIR
	#define UTK_LOCALE_DATA_DIR "data/locale"
#endif

using namespace UtcTimeKit::calendar;

namespace {
	struct Settings {
		std::filesystem::path locale_path{};
		std::filesystem::path zoneinfo_path{};
		std::string default_locale{};
	};

	std::mutex g_lock{};
	Settings g_settings{};

	const char *non_empty_env(const char *name) {
		const char *const value = std::getenv(name);
		return (value != nullptr && value[0] != '\0') ? value : nullptr;
	}

	std::string strip_locale_suffix(std::string locale) {
		const auto cut = locale.find_first_of(".@");
		if (cut != std::string::npos) locale.resize(cut);
		return locale;
	}
} // namespace

std::filesystem::path UtcTimeKit::calendar::config::get_locale_path(void) {
	{
		const std::lock_guard lock{g_lock};
		if (!g_settings.locale_path.empty()) return g_settings.locale_path;
	}
	if (const char *const env = non_empty_env("UTK_LOCALE_PATH")) return env;
	return UTK_LOCALE_DATA_DIR;
}

void UtcTimeKit::calendar::config::set_locale_path(const std::filesystem::path &path) {
	const std::lock_guard lock{g_lock};
	g_settings.locale_path = path;
}

std::filesystem::path UtcTimeKit::calendar::config::get_zoneinfo_path(void) {
	{
		const std::lock_guard lock{g_lock};
		if (!g_settings.zoneinfo_path.empty()) return g_settings.zoneinfo_path;
	}
	if (const char *const env = non_empty_env("UTK_ZONEINFO_PATH")) return env;
	return "/usr/share/zoneinfo";
}

void UtcTimeKit::calendar::config::set_zoneinfo_path(const std::filesystem::path &path) {
	const std::lock_guard lock{g_lock};
	g_settings.zoneinfo_path = path;
}

std::string UtcTimeKit::calendar::config::get_default_locale(void) {
	{
		const std::lock_guard lock{g_lock};
		if (!g_settings.default_locale.empty()) return g_settings.default_locale;
	}
	for (const char *const name : {"UTK_LOCALE", "LC_ALL", "LC_TIME", "LANG"}) {
		if (const char *const env = non_empty_env(name)) {
			const std::string locale = strip_locale_suffix(env);
			if (!locale.empty()) return locale;
		}
	}
	return "en";
}

void UtcTimeKit::calendar::config::set_default_locale(const std::string &locale) {
	const std::lock_guard lock{g_lock};
	g_settings.default_locale = locale;
}

void UtcTimeKit::calendar::config::reset(void) {
	const std::lock_guard lock{g_lock};
	g_settings = Settings{};
}
