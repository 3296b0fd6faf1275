// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef UTK_CALENDAR_DURATION_PARSER_HEADER
#define UTK_CALENDAR_DURATION_PARSER_HEADER

#include <cstdint>
#include <optional>
#include <string>

#include "Common.hpp"
#include "Duration.hpp"

namespace UtcTimeKit::calendar {

	enum class DurationUnit { week, day, hour, minute, second, millisecond, microsecond };

	// "wks.", "Hours", "usec", ... case-insensitive
	EXPORT std::optional<DurationUnit> duration_unit_from_alias(const std::string &alias);
	EXPORT int64_t microseconds_per(DurationUnit unit) noexcept;

	/**
	 * @brief Read free-form duration text
	 *
	 * Text with a colon is read as a clock ("2:04:13:02.266", "1:30", ":05",
	 * "2 days, 5:34:56"), anything else as a sequence of quantity and unit tokens
	 * ("1w 3d 2h 32m", "1,5 hours and 10 secs"). A bare number counts seconds. A leading sign
	 * on the whole text negates the result.
	 * @throws ParseError naming each attempted grammar with its reason
	 */
	EXPORT Duration parse_duration(const std::string &text);
	EXPORT Duration parse_duration(double seconds);

} // namespace UtcTimeKit::calendar

#endif
