// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef UTK_CALENDAR_CONFIG_HEADER
#define UTK_CALENDAR_CONFIG_HEADER

#include <filesystem>
#include <string>

#include "Common.hpp"

namespace UtcTimeKit::calendar::config {

	/**
	 * @brief Directory holding the <locale>.json name tables
	 *
	 * Priority: set_locale_path() > UTK_LOCALE_PATH env > the data directory of the build
	 */
	EXPORT std::filesystem::path get_locale_path(void);
	EXPORT void set_locale_path(const std::filesystem::path &path);

	// Priority: set_zoneinfo_path() > UTK_ZONEINFO_PATH env > /usr/share/zoneinfo
	EXPORT std::filesystem::path get_zoneinfo_path(void);
	EXPORT void set_zoneinfo_path(const std::filesystem::path &path);

	/**
	 * @brief Locale used when a caller does not name one
	 *
	 * Priority: set_default_locale() > UTK_LOCALE > LC_ALL > LC_TIME > LANG > "en".
	 * Encoding and modifier suffixes are dropped, "de_DE.UTF-8@euro" yields "de_DE".
	 */
	EXPORT std::string get_default_locale(void);
	EXPORT void set_default_locale(const std::string &locale);

	// forget every programmatic setting, environment and defaults apply again
	EXPORT void reset(void);

} // namespace UtcTimeKit::calendar::config

#endif
