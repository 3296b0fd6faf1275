// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "UtcTimeKit/calendar/Format.hpp"

#include "UtcTimeKit/calendar/Pattern.hpp"
#include "low_level/civil.hpp"
#include "low_level/digits.hpp"
#include "low_level/text.hpp"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;
using namespace UtcTimeKit::calendar::source::low_level;

std::string UtcTimeKit::calendar::format(const Instant &instant, const std::string &pattern,
										 const FormatOptions &options) {
	UtcOffset offset{};
	if (!options.zone.empty()) {
		const TimezoneProvider &timezones =
			options.timezones ? *options.timezones : default_timezone_provider();
		offset = timezones.offset_at(options.zone, instant);
	}

	if (iequals(pattern, "ISO8601")) {
		const Instant wall = instant + Duration::from_microseconds(offset.seconds * US_PER_SECOND);
		std::string out = wall.isoformat();
		out.resize(out.size() - 6); // "+00:00"
		return out + format_offset(offset.seconds, true);
	}

	static const LocaleData s_no_names{};
	const CompiledPlan plan = compile(pattern, Mode::format);
	if (!plan.is_locale_dependent()) return plan.render(instant, offset, s_no_names);

	const LocaleProvider &locales = options.locales ? *options.locales : default_locale_provider();
	const auto locale = resolve_locale(locales, options.locale);
	return plan.render(instant, offset, *locale);
}
