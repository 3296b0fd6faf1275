// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "UtcTimeKit/calendar/Pattern.hpp"

#include <boost/regex.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string_view>
#include <unordered_map>

#include "low_level/civil.hpp"
#include "low_level/digits.hpp"
#include "low_level/text.hpp"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;
using namespace UtcTimeKit::calendar::source::low_level;
using namespace std::string_literals;

struct CompiledPlan::Matcher {
	std::string source;
	boost::regex regex;
};

// ============================================================================
// Token tables
// ============================================================================

namespace {
	struct Mapping {
		Field field;
		uint8_t width;
	};

	const std::unordered_map<std::string_view, Mapping> &directives(void) {
		static const std::unordered_map<std::string_view, Mapping> table{
			{"%Y", {Field::year, 4}},		   {"%y", {Field::year2, 2}},
			{"%C", {Field::century, 2}},	   {"%B", {Field::month_name, 0}},
			{"%b", {Field::month_abbr, 0}},	   {"%h", {Field::month_abbr, 0}},
			{"%m", {Field::month, 2}},		   {"%-m", {Field::month, 1}},
			{"%d", {Field::day, 2}},		   {"%-d", {Field::day, 1}},
			{"%e", {Field::day, 1}},		   {"%j", {Field::day_of_year, 3}},
			{"%-j", {Field::day_of_year, 1}},  {"%A", {Field::weekday_name, 0}},
			{"%a", {Field::weekday_abbr, 0}},  {"%w", {Field::weekday_sun0, 1}},
			{"%u", {Field::weekday_mon1, 1}},  {"%H", {Field::hour, 2}},
			{"%-H", {Field::hour, 1}},		   {"%I", {Field::hour12, 2}},
			{"%-I", {Field::hour12, 1}},	   {"%p", {Field::day_period, 0}},
			{"%M", {Field::minute, 2}},		   {"%-M", {Field::minute, 1}},
			{"%S", {Field::second, 2}},		   {"%-S", {Field::second, 1}},
			{"%f", {Field::fraction, 6}},	   {"%z", {Field::offset, 0}},
			{"%:z", {Field::offset_colon, 0}}, {"%Z", {Field::zone_abbr, 0}},
			{"%s", {Field::timestamp, 0}},
		};
		return table;
	}

	constexpr std::string_view s_pattern_letters = "yYMdDEeHhmsSaZz";

	std::optional<Mapping> letter_run(char letter, size_t length) {
		switch (letter) {
		case 'y':
		case 'Y':
			if (length == 1) return Mapping{Field::year, 1};
			if (length == 2) return Mapping{Field::year2, 2};
			if (length == 4) return Mapping{Field::year, 4};
			break;
		case 'M':
			if (length <= 2) return Mapping{Field::month, static_cast<uint8_t>(length)};
			if (length == 3) return Mapping{Field::month_abbr, 0};
			if (length == 4) return Mapping{Field::month_name, 0};
			break;
		case 'd':
			if (length <= 2) return Mapping{Field::day, static_cast<uint8_t>(length)};
			break;
		case 'D':
			if (length <= 3) return Mapping{Field::day_of_year, static_cast<uint8_t>(length)};
			break;
		case 'E':
			if (length <= 3) return Mapping{Field::weekday_abbr, 0};
			if (length == 4) return Mapping{Field::weekday_name, 0};
			break;
		case 'e':
			if (length <= 2) return Mapping{Field::weekday_mon1, static_cast<uint8_t>(length)};
			if (length == 3) return Mapping{Field::weekday_abbr, 0};
			if (length == 4) return Mapping{Field::weekday_name, 0};
			break;
		case 'H':
			if (length <= 2) return Mapping{Field::hour, static_cast<uint8_t>(length)};
			break;
		case 'h':
			if (length <= 2) return Mapping{Field::hour12, static_cast<uint8_t>(length)};
			break;
		case 'm':
			if (length <= 2) return Mapping{Field::minute, static_cast<uint8_t>(length)};
			break;
		case 's':
			if (length <= 2) return Mapping{Field::second, static_cast<uint8_t>(length)};
			break;
		case 'S':
			if (length <= 6) return Mapping{Field::fraction, static_cast<uint8_t>(length)};
			break;
		case 'a':
			if (length <= 3) return Mapping{Field::day_period, 0};
			break;
		case 'Z':
			if (length <= 4) return Mapping{Field::offset, 0};
			if (length == 5) return Mapping{Field::offset_colon, 0};
			break;
		case 'z':
			if (length <= 4) return Mapping{Field::offset, 0};
			break;
		default: break;
		}
		return std::nullopt;
	}

	bool format_only(Field field) noexcept {
		return field == Field::century || field == Field::zone_abbr;
	}

	bool needs_locale(Field field) noexcept {
		switch (field) {
		case Field::month_name:
		case Field::month_abbr:
		case Field::weekday_name:
		case Field::weekday_abbr:
		case Field::day_period: return true;
		default: return false;
		}
	}

	void check_mode(const Segment &segment, Mode mode) {
		if (mode == Mode::parse && format_only(segment.field))
			UTK_THROW(UnsupportedTokenError,
					  "token \"" + segment.text + "\" can only be used for formatting");
	}

	std::vector<Segment> scan(const std::string &pattern, Mode mode) {
		std::vector<Segment> out{};
		std::string literal{};
		const auto flush = [&]() {
			if (literal.empty()) return;
			out.push_back(Segment{Field::literal, 0, literal});
			literal.clear();
		};
		const size_t n = pattern.size();
		size_t i = 0;
		while (i < n) {
			const char c = pattern[i];
			if (c == '%') {
				if (i + 1 >= n) UTK_THROW(UnsupportedTokenError, "pattern ends with a lone '%'");
				const char next = pattern[i + 1];
				if (next == '%') {
					literal.push_back('%');
					i += 2;
					continue;
				}
				const size_t length = ((next == '-' || next == ':') && i + 2 < n) ? 3 : 2;
				const std::string spelling = pattern.substr(i, length);
				const auto found = directives().find(spelling);
				if (found == directives().end())
					UTK_THROW(UnsupportedTokenError, "unknown directive \"" + spelling + "\"");
				flush();
				out.push_back(Segment{found->second.field, found->second.width, spelling});
				check_mode(out.back(), mode);
				i += length;
			} else if (c == '\'') {
				if (i + 1 < n && pattern[i + 1] == '\'') {
					literal.push_back('\'');
					i += 2;
					continue;
				}
				size_t j = i + 1;
				for (;;) {
					if (j >= n) UTK_THROW(UnsupportedTokenError, "unterminated quote in pattern");
					if (pattern[j] == '\'') {
						if (j + 1 < n && pattern[j + 1] == '\'') {
							literal.push_back('\'');
							j += 2;
							continue;
						}
						break;
					}
					literal.push_back(pattern[j++]);
				}
				i = j + 1;
			} else if (s_pattern_letters.find(c) != std::string_view::npos) {
				size_t j = i;
				while (j < n && pattern[j] == c) j++;
				const std::string spelling = pattern.substr(i, j - i);
				const auto mapping = letter_run(c, j - i);
				if (!mapping)
					UTK_THROW(UnsupportedTokenError, "unknown pattern token \"" + spelling + "\"");
				flush();
				out.push_back(Segment{mapping->field, mapping->width, spelling});
				check_mode(out.back(), mode);
				i = j;
			} else {
				literal.push_back(c);
				i++;
			}
		}
		flush();
		return out;
	}

	void append_escaped(std::string &out, std::string_view text, bool collapse_blanks) {
		static constexpr std::string_view specials = R"(\^$.|?*+()[]{}/-)";
		for (size_t i = 0; i < text.size(); i++) {
			const char c = text[i];
			if (collapse_blanks && std::isspace(static_cast<unsigned char>(c))) {
				while (i + 1 < text.size() && std::isspace(static_cast<unsigned char>(text[i + 1])))
					i++;
				out += R"(\s+)";
			} else if (specials.find(c) != std::string_view::npos) {
				out.push_back('\\');
				out.push_back(c);
			} else {
				out.push_back(c);
			}
		}
	}

	// "(January|Jan|...)" longest first, so a prefix never shadows a full name
	template <size_t N, size_t M>
	std::string alternation(const std::array<std::string, N> &a, const std::array<std::string, M> &b) {
		std::vector<std::string> names{};
		names.insert(names.end(), a.begin(), a.end());
		names.insert(names.end(), b.begin(), b.end());
		names.erase(std::remove(names.begin(), names.end(), std::string{}), names.end());
		std::sort(names.begin(), names.end(), [](const std::string &x, const std::string &y) {
			return x.size() != y.size() ? x.size() > y.size() : x < y;
		});
		names.erase(std::unique(names.begin(), names.end()), names.end());
		std::string out = "(";
		for (size_t i = 0; i < names.size(); i++) {
			if (i) out.push_back('|');
			append_escaped(out, names[i], false);
		}
		return out + ")";
	}

	std::string field_regex(const Segment &segment, const LocaleData *locale) {
		switch (segment.field) {
		case Field::year: return segment.width == 4 ? R"((\d{4}))" : R"((\d{1,4}))";
		case Field::year2: return R"((\d{2}))";
		case Field::month:
		case Field::day:
		case Field::hour:
		case Field::hour12:
		case Field::minute:
		case Field::second: return R"((\d{1,2}))";
		case Field::day_of_year: return R"((\d{1,3}))";
		case Field::weekday_sun0: return "([0-6])";
		case Field::weekday_mon1: return "(0?[1-7])";
		case Field::fraction: return R"((\d{1,6}))";
		case Field::offset:
		case Field::offset_colon: return R"((Z|[+-]\d{2}(?::?\d{2})?))";
		case Field::timestamp: return R"(([+-]?\d+(?:\.\d*)?))";
		case Field::month_name:
		case Field::month_abbr: return alternation(locale->months_wide, locale->months_abbreviated);
		case Field::weekday_name:
		case Field::weekday_abbr:
			return alternation(locale->weekdays_wide, locale->weekdays_abbreviated);
		case Field::day_period: return alternation(locale->day_periods, std::array<std::string, 0>{});
		case Field::literal:
		case Field::century:
		case Field::zone_abbr: break;
		}
		UTK_THROW(UnsupportedTokenError, "token \"" + segment.text + "\" cannot be parsed");
	}

	int64_t to_int(const std::string &digits) {
		return std::strtoll(digits.c_str(), nullptr, 10);
	}

	MatchResult failure(std::string reason) {
		return MatchResult{std::nullopt, std::move(reason)};
	}

	// "Z", "+05", "+0530", "+05:30"
	std::optional<int32_t> read_offset(const std::string &text) {
		if (text == "Z" || text == "z") return 0;
		const int32_t hours = static_cast<int32_t>(to_int(text.substr(1, 2)));
		std::string rest = text.substr(3);
		if (!rest.empty() && rest.front() == ':') rest.erase(0, 1);
		const int32_t minutes = rest.empty() ? 0 : static_cast<int32_t>(to_int(rest));
		if (hours > 23 || minutes > 59) return std::nullopt;
		const int32_t seconds = hours * 3600 + minutes * 60;
		return text.front() == '-' ? -seconds : seconds;
	}

	struct Collected {
		std::optional<int64_t> year{};
		std::optional<int64_t> month{};
		std::optional<int64_t> day{};
		std::optional<int64_t> day_of_year{};
		std::optional<int64_t> hour{};
		std::optional<int64_t> hour12{};
		std::optional<bool> pm{};
		int64_t minute = 0;
		int64_t second = 0;
		int64_t microsecond = 0;
		std::optional<int32_t> offset{};
		std::optional<std::string> timestamp{};
	};
} // namespace

// ============================================================================
// CompiledPlan
// ============================================================================

CompiledPlan::CompiledPlan(std::string pattern, Mode mode, std::vector<Segment> segments)
	: m_pattern(std::move(pattern))
	, m_mode(mode)
	, m_segments(std::move(segments)) {}

bool CompiledPlan::is_numeric_only() const noexcept {
	return m_segments.size() == 1 && m_segments.front().field == Field::timestamp;
}

bool CompiledPlan::is_locale_dependent() const noexcept {
	return std::any_of(m_segments.begin(), m_segments.end(),
					   [](const Segment &s) { return needs_locale(s.field); });
}

std::string CompiledPlan::regex_source(const LocaleData *locale) const {
	if (locale == nullptr && is_locale_dependent())
		UTK_THROW(InvalidValueError, "pattern \"" + m_pattern + "\" needs locale names");
	std::string out{};
	for (const Segment &segment : m_segments) {
		if (segment.field == Field::literal)
			append_escaped(out, segment.text, true);
		else
			out += field_regex(segment, locale);
	}
	return out;
}

std::shared_ptr<const CompiledPlan::Matcher> CompiledPlan::matcher(const LocaleData &locale) const {
	if (m_matcher) return m_matcher;
	auto source = regex_source(&locale);
	try {
		boost::regex regex{source, boost::regex::perl | boost::regex::icase};
		return std::make_shared<const Matcher>(Matcher{std::move(source), std::move(regex)});
	} catch (const boost::regex_error &e) {
		UTK_THROW(UnsupportedTokenError,
				  "pattern \"" + m_pattern + "\" yields an invalid matcher: " + e.what());
	}
}

MatchResult CompiledPlan::match(const std::string &text, const LocaleData &locale) const {
	if (m_mode != Mode::parse)
		UTK_THROW(InvalidValueError, "pattern \"" + m_pattern + "\" was compiled for formatting");
	const auto prepared = matcher(locale);
	boost::smatch found;
	if (!boost::regex_match(text, found, prepared->regex)) return failure("no match");

	Collected c{};
	size_t group = 1;
	for (const Segment &segment : m_segments) {
		if (segment.field == Field::literal) continue;
		const std::string value = found[static_cast<int>(group++)].str();
		switch (segment.field) {
		case Field::year: c.year = to_int(value); break;
		case Field::year2: {
			const int64_t yy = to_int(value);
			c.year = yy >= 69 ? 1900 + yy : 2000 + yy;
			break;
		}
		case Field::month: c.month = to_int(value); break;
		case Field::month_name:
		case Field::month_abbr: {
			const auto month = locale.month_from_name(value);
			if (!month) return failure("unknown month name \"" + value + "\"");
			c.month = *month;
			break;
		}
		case Field::day: c.day = to_int(value); break;
		case Field::day_of_year: c.day_of_year = to_int(value); break;
		case Field::weekday_name:
		case Field::weekday_abbr:
			if (!locale.weekday_from_name(value))
				return failure("unknown weekday name \"" + value + "\"");
			break;
		case Field::weekday_sun0:
		case Field::weekday_mon1: break; // range checked by the matcher
		case Field::hour: c.hour = to_int(value); break;
		case Field::hour12: c.hour12 = to_int(value); break;
		case Field::day_period: {
			const auto pm = locale.is_pm_marker(value);
			if (!pm) return failure("unknown day period \"" + value + "\"");
			c.pm = *pm;
			break;
		}
		case Field::minute: c.minute = to_int(value); break;
		case Field::second: c.second = to_int(value); break;
		case Field::fraction: c.microsecond = to_int(value + std::string(6 - value.size(), '0')); break;
		case Field::offset:
		case Field::offset_colon:
			c.offset = read_offset(value);
			if (!c.offset) return failure("utc offset \"" + value + "\" out of range");
			break;
		case Field::timestamp: c.timestamp = value; break;
		case Field::literal:
		case Field::century:
		case Field::zone_abbr: break;
		}
	}

	if (c.timestamp) {
		try {
			const Instant t = Instant::from_timestamp(std::strtod(c.timestamp->c_str(), nullptr));
			return MatchResult{ParsedTime{t, std::nullopt, true}, {}};
		} catch (const RangeOverflowError &) {
			return failure("timestamp " + *c.timestamp + " out of range");
		}
	}

	const int64_t year = c.year.value_or(1900);
	if (year < 1 || year > 9999) return failure("year " + std::to_string(year) + " out of range");
	int64_t month = c.month.value_or(1);
	int64_t day = c.day.value_or(1);
	if (c.day_of_year) {
		const int64_t doy = *c.day_of_year;
		if (doy < 1 || doy > days_in_year(year))
			return failure("day of year " + std::to_string(doy) + " out of range");
		if (!c.month && !c.day) {
			const CivilDate date = civil_from_days(days_from_civil(year, 1, 1) + doy - 1);
			month = date.month;
			day = date.day;
		}
	}
	if (month < 1 || month > 12) return failure("month " + std::to_string(month) + " out of range");
	if (day < 1 || day > days_in_month(year, static_cast<uint32_t>(month)))
		return failure("day " + std::to_string(day) + " out of range");

	int64_t hour = 0;
	if (c.hour) {
		hour = *c.hour;
		if (hour > 23) return failure("hour " + std::to_string(hour) + " out of range");
	} else if (c.hour12) {
		hour = *c.hour12;
		if (hour < 1 || hour > 12) return failure("hour " + std::to_string(hour) + " out of range");
		hour = c.pm.value_or(false) ? hour % 12 + 12 : hour % 12; // no marker reads as AM
	}
	if (c.minute > 59) return failure("minute " + std::to_string(c.minute) + " out of range");
	if (c.second > 59) return failure("second " + std::to_string(c.second) + " out of range");

	const Instant wall = Instant::from_fields(
		static_cast<int32_t>(year), static_cast<uint32_t>(month), static_cast<uint32_t>(day),
		static_cast<uint32_t>(hour), static_cast<uint32_t>(c.minute),
		static_cast<uint32_t>(c.second), static_cast<uint32_t>(c.microsecond));
	return MatchResult{ParsedTime{wall, c.offset, false}, {}};
}

std::string CompiledPlan::render(const Instant &instant, const UtcOffset &offset,
								 const LocaleData &locale) const {
	if (m_mode != Mode::format)
		UTK_THROW(InvalidValueError, "pattern \"" + m_pattern + "\" was compiled for parsing");
	const Instant wall = instant + Duration::from_microseconds(offset.seconds * US_PER_SECOND);
	const Instant::Fields f = wall.fields();
	std::string out{};
	for (const Segment &segment : m_segments) {
		switch (segment.field) {
		case Field::literal: out += segment.text; break;
		case Field::year:
			if (segment.width == 1)
				out += std::to_string(f.year);
			else
				append_padded(out, f.year, segment.width);
			break;
		case Field::year2: append_padded(out, f.year % 100, 2); break;
		case Field::century: append_padded(out, f.year / 100, 2); break;
		case Field::month_name: out += locale.month_name(f.month, false); break;
		case Field::month_abbr: out += locale.month_name(f.month, true); break;
		case Field::month: append_padded(out, f.month, segment.width); break;
		case Field::day: append_padded(out, f.day, segment.width); break;
		case Field::day_of_year: append_padded(out, wall.day_of_year(), segment.width); break;
		case Field::weekday_name: out += locale.weekday_name(wall.isoweekday(), false); break;
		case Field::weekday_abbr: out += locale.weekday_name(wall.isoweekday(), true); break;
		case Field::weekday_sun0: append_padded(out, wall.isoweekday() % 7, 1); break;
		case Field::weekday_mon1: append_padded(out, wall.isoweekday(), segment.width); break;
		case Field::hour: append_padded(out, f.hour, segment.width); break;
		case Field::hour12:
			append_padded(out, f.hour % 12 == 0 ? 12 : f.hour % 12, segment.width);
			break;
		case Field::day_period: out += locale.day_period(f.hour >= 12); break;
		case Field::minute: append_padded(out, f.minute, segment.width); break;
		case Field::second: append_padded(out, f.second, segment.width); break;
		case Field::fraction: {
			std::string digits{};
			append_padded(digits, f.microsecond, 6);
			out.append(digits, 0, segment.width); // truncated, never rounded
			break;
		}
		case Field::offset: out += format_offset(offset.seconds, false); break;
		case Field::offset_colon: out += format_offset(offset.seconds, true); break;
		case Field::zone_abbr: out += offset.abbreviation; break;
		case Field::timestamp:
			append_padded(out, floor_div(instant.microseconds_since_epoch(), US_PER_SECOND), 1);
			break;
		}
	}
	return out;
}

CompiledPlan UtcTimeKit::calendar::compile(const std::string &pattern, Mode mode) {
	CompiledPlan plan{pattern, mode, scan(pattern, mode)};
	if (mode == Mode::parse && !plan.is_locale_dependent()) {
		static const LocaleData s_no_names{};
		plan.m_matcher = plan.matcher(s_no_names);
	}
	return plan;
}
