// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef UTK_CALENDAR_PATTERN_HEADER
#define UTK_CALENDAR_PATTERN_HEADER

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Common.hpp"
#include "Instant.hpp"
#include "Locale.hpp"
#include "Timezone.hpp"

namespace UtcTimeKit::calendar {

	enum class Mode { parse, format };

	// Meaning of one pattern token, shared by both token grammars
	enum class Field : uint8_t {
		literal,
		year,		  // width 4 padded, width 1 unpadded
		year2,		  // two digits, 69..99 -> 19xx, 00..68 -> 20xx
		century,	  // format only
		month_name,	  // wide
		month_abbr,	  // abbreviated
		month,		  // numeric
		day,		  // day of month
		day_of_year,  // numeric
		weekday_name, // wide
		weekday_abbr, // abbreviated
		weekday_sun0, // 0..6, Sunday = 0
		weekday_mon1, // 1..7, Monday = 1
		hour,		  // 0..23
		hour12,		  // 1..12
		day_period,	  // AM/PM marker
		minute,
		second,
		fraction,	  // width = number of digits
		offset,		  // +HHMM
		offset_colon, // +HH:MM
		zone_abbr,	  // format only
		timestamp,	  // POSIX seconds
	};

	struct Segment {
		Field field;
		uint8_t width;	  // minimum digits of numeric fields, digits of fractions
		std::string text; // literal text, or the token as spelled in the pattern
	};

	// Civil fields read from text; the offset is not applied yet
	struct ParsedTime {
		Instant wall{};
		std::optional<int32_t> offset{}; // seconds east of UTC, when the text carried one
		bool absolute = false;			 // wall already is UTC (read from a timestamp)
	};

	struct MatchResult {
		std::optional<ParsedTime> value{};
		std::string reason{}; // why value is empty
		explicit operator bool() const noexcept { return value.has_value(); }
	};

	class CompiledPlan;

	/**
	 * @brief Translate POSIX "%" directives and Unicode letter runs
	 *
	 * Both grammars may appear in one pattern. Literal text can be quoted with single quotes;
	 * a doubled single quote is a literal apostrophe.
	 * @throws UnsupportedTokenError for tokens without a mapping in the requested mode
	 */
	EXPORT CompiledPlan compile(const std::string &pattern, Mode mode);

	/**
	 * @brief A pattern translated into either a matcher or a rendering plan
	 *
	 * Created by compile(). Copies are cheap and share the prepared matcher.
	 */
	class EXPORT CompiledPlan final {
	  public:
		[[nodiscard]] Mode mode() const noexcept { return m_mode; }
		[[nodiscard]] const std::string &pattern() const noexcept { return m_pattern; }
		[[nodiscard]] const std::vector<Segment> &segments() const noexcept { return m_segments; }
		// the pattern is nothing but a POSIX timestamp
		[[nodiscard]] bool is_numeric_only() const noexcept;
		// names or day periods need locale tables
		[[nodiscard]] bool is_locale_dependent() const noexcept;

		/**
		 * @brief Regular expression the matcher uses, anchored on both ends when applied
		 * @param locale required when the plan is locale dependent
		 */
		[[nodiscard]] std::string regex_source(const LocaleData *locale) const;

		// parse plans only
		[[nodiscard]] MatchResult match(const std::string &text, const LocaleData &locale) const;
		// format plans only; offset shifts the instant to the wall clock of its zone
		[[nodiscard]] std::string render(const Instant &instant, const UtcOffset &offset,
										 const LocaleData &locale) const;

	  private:
		friend CompiledPlan compile(const std::string &pattern, Mode mode);
		struct Matcher;

		CompiledPlan(std::string pattern, Mode mode, std::vector<Segment> segments);
		std::shared_ptr<const Matcher> matcher(const LocaleData &locale) const;

		std::string m_pattern;
		Mode m_mode;
		std::vector<Segment> m_segments;
		std::shared_ptr<const Matcher> m_matcher{}; // prepared when not locale dependent
	};

} // namespace UtcTimeKit::calendar

#endif
