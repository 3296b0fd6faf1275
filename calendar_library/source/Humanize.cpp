// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "UtcTimeKit/calendar/Humanize.hpp"

#include <algorithm>
#include <cmath>

#include "UtcTimeKit/calendar/Log.hpp"
#include "low_level/civil.hpp"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;
using namespace UtcTimeKit::calendar::source::low_level;

namespace {
	struct Rung {
		SpanUnit unit;
		const char *name; // unit key of the locale phrases
		double seconds;
	};

	constexpr Rung s_ladder[] = {
		{SpanUnit::year, "year", 365.0 * SECONDS_PER_DAY},
		{SpanUnit::month, "month", 30.0 * SECONDS_PER_DAY},
		{SpanUnit::week, "week", 7.0 * SECONDS_PER_DAY},
		{SpanUnit::day, "day", SECONDS_PER_DAY},
		{SpanUnit::hour, "hour", 3600.0},
		{SpanUnit::minute, "minute", 60.0},
		{SpanUnit::second, "second", 1.0},
	};
} // namespace

std::string UtcTimeKit::calendar::humanize(const Duration &duration, const HumanizeConfig &config,
										   const LocaleProvider &locales) {
	if (config.granularity == SpanUnit::decade || config.granularity == SpanUnit::century)
		UTK_THROW(InvalidUnitError, "granularity \"" + std::string{to_string(config.granularity)} +
										"\" is not supported");

	const int64_t whole_seconds = floor_div(duration.total_microseconds(), US_PER_SECOND);
	const double magnitude = std::fabs(static_cast<double>(whole_seconds));

	const Rung *chosen = nullptr;
	double value = 0;
	for (const Rung &rung : s_ladder) {
		value = magnitude / rung.seconds;
		if (rung.unit == config.granularity) {
			if (magnitude > 0) value = std::max(value, 1.0);
			chosen = &rung;
			break;
		}
		if (value >= config.threshold) {
			chosen = &rung;
			break;
		}
	}

	// half to even under the default rounding mode
	const auto count = static_cast<int64_t>(std::nearbyint(value));
	const auto locale = resolve_locale(locales, config.locale);
	log_verbose("humanize ", whole_seconds, " s as ", count, " ", chosen->name);

	if (config.add_direction)
		return locale->format_relative(config.style, chosen->name, count, whole_seconds >= 0);
	return locale->format_unit(config.style, chosen->name, count);
}

std::string UtcTimeKit::calendar::time_from(const Instant &instant, const Instant &other,
											HumanizeConfig config, const LocaleProvider &locales) {
	return humanize(instant - other, config, locales);
}

std::string UtcTimeKit::calendar::time_to(const Instant &instant, const Instant &other,
										  HumanizeConfig config, const LocaleProvider &locales) {
	return humanize(other - instant, config, locales);
}

std::string UtcTimeKit::calendar::time_from_now(const Instant &instant, HumanizeConfig config,
												const LocaleProvider &locales) {
	return time_from(instant, Instant::now(), config, locales);
}

std::string UtcTimeKit::calendar::time_to_now(const Instant &instant, HumanizeConfig config,
											  const LocaleProvider &locales) {
	return time_to(instant, Instant::now(), config, locales);
}
