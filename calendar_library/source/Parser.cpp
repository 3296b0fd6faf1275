// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "UtcTimeKit/calendar/Parser.hpp"

#include <boost/regex.hpp>

#include <cstdlib>

#include "UtcTimeKit/calendar/Log.hpp"
#include "UtcTimeKit/calendar/Pattern.hpp"
#include "low_level/civil.hpp"
#include "low_level/digits.hpp"
#include "low_level/text.hpp"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;
using namespace UtcTimeKit::calendar::source::low_level;

const FormatSpec &UtcTimeKit::calendar::default_formats(void) {
	static const FormatSpec formats{ISO8601, TIMESTAMP};
	return formats;
}

const std::vector<std::string> &UtcTimeKit::calendar::iso8601_patterns(void) {
	static const std::vector<std::string> patterns = [] {
		static constexpr const char *times[] = {
			"%H:%M:%S.%f%z", "%H:%M:%S%z", "%H:%M%z", "%H:%M:%S.%f", "%H:%M:%S", "%H:%M",
		};
		static constexpr const char *basic_times[] = {
			"%H%M%S.%f%z", "%H%M%S%z", "%H%M%z", "%H%M%S.%f", "%H%M%S", "%H%M",
		};
		std::vector<std::string> out{};
		for (const char *const separator : {"T", " "})
			for (const char *const time : times) out.push_back(std::string{"%Y-%m-%d"} + separator + time);
		for (const char *const time : basic_times) out.push_back(std::string{"%Y%m%dT"} + time);
		out.emplace_back("%Y-%m-%d");
		out.emplace_back("%Y%m%d");
		out.emplace_back("%Y-%m");
		out.emplace_back("%Y");
		return out;
	}();
	return patterns;
}

namespace {
	struct IsoPlan {
		CompiledPlan plan;
		std::optional<boost::regex> shape; // exact digit layout of the basic format
	};

	// the basic format has no separators, so every field needs its full width
	std::optional<boost::regex> basic_shape(const std::string &pattern) {
		if (pattern.rfind("%Y%m%d", 0) != 0) return std::nullopt;
		std::string source{};
		for (size_t i = 0; i < pattern.size(); i++) {
			if (pattern[i] != '%') {
				source += pattern[i] == '.' ? std::string{R"(\.)"} : std::string(1, pattern[i]);
				continue;
			}
			switch (pattern[++i]) {
			case 'Y': source += R"(\d{4})"; break;
			case 'f': source += R"(\d{1,6})"; break;
			case 'z': source += R"((?:Z|[+-]\d{2}(?::?\d{2})?))"; break;
			default: source += R"(\d{2})"; break;
			}
		}
		return boost::regex{source, boost::regex::perl | boost::regex::icase};
	}

	const std::vector<IsoPlan> &iso8601_plans(void) {
		static const std::vector<IsoPlan> plans = [] {
			std::vector<IsoPlan> out{};
			for (const auto &pattern : iso8601_patterns())
				out.push_back(IsoPlan{compile(pattern, Mode::parse), basic_shape(pattern)});
			return out;
		}();
		return plans;
	}

	// "18,5" reads as "18.5" and digits past the microsecond are dropped
	std::string normalize_iso_fraction(const std::string &text) {
		static const boost::regex fraction{R"((?<=\d{2})[.,](\d{1,6})\d*)"};
		return boost::regex_replace(text, fraction, ".$1");
	}

	bool is_numeric_candidate(const std::string &format) {
		return iequals(format, TIMESTAMP) || trim(format) == "%s";
	}

	struct Context {
		const Input &input;
		const std::string value; // the input as shown in errors
		const ParseOptions &options;
		const TimezoneProvider &timezones;
		const LocaleProvider &locales;
		Attempts attempts{};
		std::shared_ptr<const LocaleData> locale{};

		const LocaleData &names(void) {
			if (!locale) locale = resolve_locale(locales, options.locale);
			return *locale;
		}
	};

	std::optional<Instant> from_seconds(Context &ctx, const std::string &candidate, double seconds) {
		try {
			return Instant::from_timestamp(seconds);
		} catch (const RangeOverflowError &e) {
			ctx.attempts.push_back(Attempt{candidate, e.reason()});
			return std::nullopt;
		}
	}

	std::optional<Instant> try_timestamp(Context &ctx, const std::string &candidate) {
		if (const double *const number = std::get_if<double>(&ctx.input))
			return from_seconds(ctx, candidate, *number);
		if (const int64_t *const seconds = std::get_if<int64_t>(&ctx.input)) {
			int64_t us{};
			if (__builtin_mul_overflow(*seconds, US_PER_SECOND, &us)) {
				ctx.attempts.push_back(Attempt{candidate, "timestamp is outside 0001-01-01..9999-12-31"});
				return std::nullopt;
			}
			try {
				return Instant::from_microseconds(us);
			} catch (const RangeOverflowError &e) {
				ctx.attempts.push_back(Attempt{candidate, e.reason()});
				return std::nullopt;
			}
		}
		static const boost::regex decimal{R"(^\s*[+-]?(?:\d+(?:\.\d*)?|\.\d+)\s*$)"};
		const std::string &text = std::get<std::string>(ctx.input);
		if (!boost::regex_match(text, decimal)) {
			ctx.attempts.push_back(Attempt{candidate, "not a decimal number"});
			return std::nullopt;
		}
		return from_seconds(ctx, candidate, std::strtod(text.c_str(), nullptr));
	}

	// wall fields plus offset or default zone to UTC
	std::optional<Instant> try_plan(Context &ctx, const std::string &candidate,
									const CompiledPlan &plan, const std::string &text) {
		static const LocaleData s_no_names{};
		const MatchResult result =
			plan.match(text, plan.is_locale_dependent() ? ctx.names() : s_no_names);
		if (!result) {
			ctx.attempts.push_back(Attempt{candidate, result.reason});
			return std::nullopt;
		}
		const ParsedTime &parsed = *result.value;
		try {
			if (parsed.absolute) return parsed.wall;
			if (parsed.offset)
				return Instant::from_microseconds(parsed.wall.microseconds_since_epoch() -
												  *parsed.offset * US_PER_SECOND);
			if (ctx.options.default_tz && !ctx.options.default_tz->empty())
				return ctx.timezones.to_utc(*ctx.options.default_tz, parsed.wall);
			return parsed.wall;
		} catch (const RangeOverflowError &e) {
			ctx.attempts.push_back(Attempt{candidate, e.reason()});
			return std::nullopt;
		}
	}

	std::optional<ParseOutcome> try_format(Context &ctx, const std::string &format) {
		if (iequals(format, ISO8601)) {
			const auto &patterns = iso8601_patterns();
			const auto &plans = iso8601_plans();
			const std::string text = normalize_iso_fraction(std::get<std::string>(ctx.input));
			for (size_t i = 0; i < plans.size(); i++) {
				if (plans[i].shape && !boost::regex_match(text, *plans[i].shape)) {
					ctx.attempts.push_back(Attempt{patterns[i], "no match"});
					continue;
				}
				if (auto instant = try_plan(ctx, patterns[i], plans[i].plan, text))
					return ParseOutcome{*instant, format, patterns[i]};
			}
			return std::nullopt;
		}
		if (iequals(format, TIMESTAMP)) {
			if (auto instant = try_timestamp(ctx, format))
				return ParseOutcome{*instant, format, format};
			return std::nullopt;
		}
		std::optional<CompiledPlan> plan{};
		try {
			plan.emplace(compile(format, Mode::parse));
		} catch (const UnsupportedTokenError &e) {
			ctx.attempts.push_back(Attempt{format, e.reason()});
			return std::nullopt;
		}
		if (auto instant = try_plan(ctx, format, *plan, std::get<std::string>(ctx.input)))
			return ParseOutcome{*instant, format, format};
		return std::nullopt;
	}

	std::string describe(const Input &input) {
		if (const double *const number = std::get_if<double>(&input)) return format_double(*number);
		if (const int64_t *const seconds = std::get_if<int64_t>(&input)) return std::to_string(*seconds);
		return std::get<std::string>(input);
	}
} // namespace

ParseOutcome UtcTimeKit::calendar::parse_outcome(const Input &input, const FormatSpec &formats,
												 const ParseOptions &options) {
	const TimezoneProvider &timezones =
		options.timezones ? *options.timezones : default_timezone_provider();
	const LocaleProvider &locales = options.locales ? *options.locales : default_locale_provider();
	if (options.default_tz && !options.default_tz->empty() &&
		!timezones.is_known(*options.default_tz))
		UTK_THROW(InvalidValueError, "unrecognized time zone \"" + *options.default_tz + "\"");

	Context ctx{input, describe(input), options, timezones, locales};

	if (!std::holds_alternative<std::string>(input)) {
		bool any_numeric = false;
		for (const auto &format : formats) {
			if (!is_numeric_candidate(format)) continue;
			any_numeric = true;
			if (auto instant = try_timestamp(ctx, format)) return ParseOutcome{*instant, format, format};
		}
		if (!any_numeric) {
			if (auto instant = try_timestamp(ctx, TIMESTAMP))
				return ParseOutcome{*instant, TIMESTAMP, TIMESTAMP};
		}
		UTK_THROW_PARSE(ctx.value, ctx.attempts);
	}

	for (const auto &format : formats) {
		if (auto outcome = try_format(ctx, format)) {
			log_verbose("parsed \"", ctx.value, "\" with \"", outcome->pattern, "\"");
			return *outcome;
		}
	}
	log_verbose("no format matches \"", ctx.value, "\"");
	UTK_THROW_PARSE(ctx.value, ctx.attempts);
}

Instant UtcTimeKit::calendar::parse(const Input &input, const FormatSpec &formats,
									const ParseOptions &options) {
	return parse_outcome(input, formats, options).instant;
}
