// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef UTK_CALENDAR_FORMAT_HEADER
#define UTK_CALENDAR_FORMAT_HEADER

#include <string>

#include "Common.hpp"
#include "Instant.hpp"
#include "Locale.hpp"
#include "Timezone.hpp"

namespace UtcTimeKit::calendar {

	struct FormatOptions {
		std::string zone{};	  // shift to this zone first; empty means UTC
		std::string locale{}; // empty means the configured default
		const TimezoneProvider *timezones = nullptr;
		const LocaleProvider *locales = nullptr;
	};

	/**
	 * @brief Render an instant with a pattern, or as ISO 8601 with the zone's offset
	 * @throws UnsupportedTokenError for unknown tokens
	 * @throws InvalidValueError for an unknown zone or locale
	 */
	EXPORT std::string format(const Instant &instant, const std::string &pattern = "ISO8601",
							  const FormatOptions &options = {});

} // namespace UtcTimeKit::calendar

#endif
