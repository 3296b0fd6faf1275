// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef UTK_CALENDAR_PARSER_HEADER
#define UTK_CALENDAR_PARSER_HEADER

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Common.hpp"
#include "Instant.hpp"
#include "Locale.hpp"
#include "Timezone.hpp"

namespace UtcTimeKit::calendar {

	// Text or POSIX seconds, whole or fractional
	using Input = std::variant<std::string, double, int64_t>;

	// Candidates tried in order: patterns or the keywords below (case-insensitive)
	using FormatSpec = std::vector<std::string>;

	inline constexpr const char *ISO8601 = "ISO8601";
	inline constexpr const char *TIMESTAMP = "timestamp";

	// {"ISO8601", "timestamp"}
	EXPORT const FormatSpec &default_formats(void);
	// the concrete patterns behind "ISO8601", most specific first
	EXPORT const std::vector<std::string> &iso8601_patterns(void);

	struct ParseOptions {
		// zone of text without an offset; "local" is the system zone, empty means UTC
		std::optional<std::string> default_tz{};
		// locale of month and weekday names; empty means the configured default
		std::string locale{};
		const TimezoneProvider *timezones = nullptr; // default_timezone_provider() if null
		const LocaleProvider *locales = nullptr;	 // default_locale_provider() if null
	};

	struct ParseOutcome {
		Instant instant;
		std::string format;	 // the winning FormatSpec entry
		std::string pattern; // the concrete pattern, differs from format for keywords
	};

	/**
	 * @brief Try every candidate of formats on the input, first match wins
	 *
	 * Numeric input only tries numeric candidates ("timestamp", "%s") and falls back to the
	 * timestamp reading when formats has none.
	 * @throws ParseError listing each attempted candidate with its reason
	 * @throws InvalidValueError when options.default_tz names an unknown zone
	 */
	EXPORT ParseOutcome parse_outcome(const Input &input,
									  const FormatSpec &formats = default_formats(),
									  const ParseOptions &options = {});

	EXPORT Instant parse(const Input &input, const FormatSpec &formats = default_formats(),
						 const ParseOptions &options = {});

} // namespace UtcTimeKit::calendar

#endif
