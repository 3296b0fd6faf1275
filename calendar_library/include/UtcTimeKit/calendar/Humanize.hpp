// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef UTK_CALENDAR_HUMANIZE_HEADER
#define UTK_CALENDAR_HUMANIZE_HEADER

#include <string>

#include "Common.hpp"
#include "Duration.hpp"
#include "Instant.hpp"
#include "Locale.hpp"
#include "Span.hpp"

namespace UtcTimeKit::calendar {

	struct HumanizeConfig {
		std::string locale{};				   // empty means the configured default
		bool add_direction = false;			   // "in 3 hours" / "3 hours ago"
		SpanUnit granularity = SpanUnit::second; // finest unit that may be chosen
		double threshold = 0.85;
		Style style = Style::long_form;
	};

	/**
	 * @brief Render a duration as a count of one unit, e.g. "3 hours"
	 *
	 * Units are tried from years (365 days) and months (30 days) down to the granularity.
	 * The first unit whose value reaches the threshold is chosen and its value is
	 * rounded half to even.
	 * @throws InvalidUnitError for a decade or century granularity
	 * @throws InvalidValueError for an unknown locale
	 */
	EXPORT std::string humanize(const Duration &duration, const HumanizeConfig &config = {},
								const LocaleProvider &locales = default_locale_provider());

	// humanize(instant - other), with direction unless the config says otherwise
	EXPORT std::string time_from(const Instant &instant, const Instant &other,
								 HumanizeConfig config = {.add_direction = true},
								 const LocaleProvider &locales = default_locale_provider());
	// humanize(other - instant)
	EXPORT std::string time_to(const Instant &instant, const Instant &other,
							   HumanizeConfig config = {.add_direction = true},
							   const LocaleProvider &locales = default_locale_provider());

	// relative to Instant::now(), "in 3 hours" for an instant three hours ahead
	EXPORT std::string time_from_now(const Instant &instant,
									 HumanizeConfig config = {.add_direction = true},
									 const LocaleProvider &locales = default_locale_provider());
	EXPORT std::string time_to_now(const Instant &instant,
								   HumanizeConfig config = {.add_direction = true},
								   const LocaleProvider &locales = default_locale_provider());

} // namespace UtcTimeKit::calendar

#endif
