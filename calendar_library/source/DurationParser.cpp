// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "UtcTimeKit/calendar/DurationParser.hpp"

#include <boost/regex.hpp>

#include <algorithm>
#include <cstdlib>
#include <string_view>
#include <vector>

#include "UtcTimeKit/calendar/Log.hpp"
#include "low_level/civil.hpp"
#include "low_level/text.hpp"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;
using namespace UtcTimeKit::calendar::source::low_level;

namespace {
	struct Alias {
		std::string_view spelling;
		DurationUnit unit;
	};

	constexpr Alias s_aliases[] = {
		{"w", DurationUnit::week},
		{"wk", DurationUnit::week},
		{"wk.", DurationUnit::week},
		{"wks", DurationUnit::week},
		{"wks.", DurationUnit::week},
		{"week", DurationUnit::week},
		{"weeks", DurationUnit::week},
		{"d", DurationUnit::day},
		{"d.", DurationUnit::day},
		{"dy", DurationUnit::day},
		{"dys", DurationUnit::day},
		{"day", DurationUnit::day},
		{"days", DurationUnit::day},
		{"h", DurationUnit::hour},
		{"h.", DurationUnit::hour},
		{"hr", DurationUnit::hour},
		{"hr.", DurationUnit::hour},
		{"hrs", DurationUnit::hour},
		{"hrs.", DurationUnit::hour},
		{"hour", DurationUnit::hour},
		{"hours", DurationUnit::hour},
		{"m", DurationUnit::minute},
		{"m.", DurationUnit::minute},
		{"min", DurationUnit::minute},
		{"min.", DurationUnit::minute},
		{"mins", DurationUnit::minute},
		{"mins.", DurationUnit::minute},
		{"minute", DurationUnit::minute},
		{"minutes", DurationUnit::minute},
		{"s", DurationUnit::second},
		{"s.", DurationUnit::second},
		{"sec", DurationUnit::second},
		{"sec.", DurationUnit::second},
		{"secs", DurationUnit::second},
		{"secs.", DurationUnit::second},
		{"second", DurationUnit::second},
		{"seconds", DurationUnit::second},
		{"ms", DurationUnit::millisecond},
		{"msec", DurationUnit::millisecond},
		{"msecs", DurationUnit::millisecond},
		{"millisecond", DurationUnit::millisecond},
		{"milliseconds", DurationUnit::millisecond},
		{"us", DurationUnit::microsecond},
		{"usec", DurationUnit::microsecond},
		{"usecs", DurationUnit::microsecond},
		{"microsecond", DurationUnit::microsecond},
		{"microseconds", DurationUnit::microsecond},
	};

	// "(?:weeks|week|wks\.|...)" longest first
	std::string alias_alternation(DurationUnit unit) {
		std::vector<std::string> spellings{};
		for (const auto &alias : s_aliases)
			if (alias.unit == unit) spellings.emplace_back(alias.spelling);
		std::sort(spellings.begin(), spellings.end(),
				  [](const std::string &a, const std::string &b) { return a.size() > b.size(); });
		std::string out = "(?:";
		for (size_t i = 0; i < spellings.size(); i++) {
			if (i) out.push_back('|');
			for (const char c : spellings[i]) {
				if (c == '.') out.push_back('\\');
				out.push_back(c);
			}
		}
		return out + ")";
	}

	// decimal comma or point
	double quantity(std::string text) {
		std::replace(text.begin(), text.end(), ',', '.');
		return std::strtod(text.c_str(), nullptr);
	}

	const boost::regex::flag_type s_flags = boost::regex::perl | boost::regex::icase;
	constexpr const char *s_number = R"((\d+(?:[.,]\d+)?|[.,]\d+))";
	constexpr const char *s_clock_seconds = R"((\d{2}(?:[.,]\d+)?))";

	struct Grammar {
		Attempts attempts{};

		void fail(const char *grammar, std::string reason) {
			attempts.push_back(Attempt{grammar, std::move(reason)});
		}

		std::optional<double> clock(const std::string &body) {
			static const boost::regex day_clock{
				std::string{R"(^(\d+):(\d{2}):(\d{2}):)"} + s_clock_seconds + "$", s_flags};
			static const boost::regex hour_clock{
				std::string{"^(?:"} + s_number + R"(\s*)" + alias_alternation(DurationUnit::week) +
					R"(\s*[,/]?\s*)?(?:)" + s_number + R"(\s*)" +
					alias_alternation(DurationUnit::day) + R"(\s*[,/]?\s*)?(\d+):(\d{2}):)" +
					s_clock_seconds + "$",
				s_flags};
			static const boost::regex minute_clock{std::string{R"(^(\d{1,2}):)"} + s_clock_seconds +
													   "$",
												   s_flags};
			static const boost::regex second_clock{std::string{"^:"} + s_clock_seconds + "$",
												   s_flags};

			boost::smatch m;
			if (boost::regex_match(body, m, day_clock)) {
				const double minutes = quantity(m[3].str());
				const double seconds = quantity(m[4].str());
				const double hours = quantity(m[2].str());
				if (hours > 23 || minutes > 59 || seconds >= 60) {
					fail("D:HH:MM:SS", "hours, minutes or seconds out of range");
				} else {
					return quantity(m[1].str()) * US_PER_DAY + hours * US_PER_HOUR +
						   minutes * US_PER_MINUTE + seconds * US_PER_SECOND;
				}
			} else {
				fail("D:HH:MM:SS", "no match");
			}
			if (boost::regex_match(body, m, hour_clock)) {
				const double hours = quantity(m[3].str());
				const double minutes = quantity(m[4].str());
				const double seconds = quantity(m[5].str());
				// a bare clock may run past a day, one following days or weeks may not
				if ((m[1].matched || m[2].matched) && hours > 23) {
					fail("[W] [D] H:MM:SS", "hours out of range");
				} else if (minutes > 59 || seconds >= 60) {
					fail("[W] [D] H:MM:SS", "minutes or seconds out of range");
				} else {
					const double weeks = m[1].matched ? quantity(m[1].str()) : 0;
					const double days = m[2].matched ? quantity(m[2].str()) : 0;
					return weeks * US_PER_WEEK + days * US_PER_DAY + hours * US_PER_HOUR +
						   minutes * US_PER_MINUTE + seconds * US_PER_SECOND;
				}
			} else {
				fail("[W] [D] H:MM:SS", "no match");
			}
			if (boost::regex_match(body, m, minute_clock)) {
				const double seconds = quantity(m[2].str());
				if (seconds >= 60) fail("M:SS", "seconds out of range");
				else return quantity(m[1].str()) * US_PER_MINUTE + seconds * US_PER_SECOND;
			} else {
				fail("M:SS", "no match");
			}
			if (boost::regex_match(body, m, second_clock)) {
				const double seconds = quantity(m[1].str());
				if (seconds >= 60) fail(":SS", "seconds out of range");
				else return seconds * US_PER_SECOND;
			} else {
				fail(":SS", "no match");
			}
			return std::nullopt;
		}

		std::optional<double> units(const std::string &body) {
			static const boost::regex bare{std::string{R"(^[+-]?)"} + s_number + "$", s_flags};
			static const boost::regex separators{R"((?:\s+|[,/&]|and\b)+)", s_flags};
			static const boost::regex token{
				std::string{R"(([+-]?)\s*)"} + s_number + R"(\s*([a-z]+\.?))", s_flags};

			if (boost::regex_match(body, bare)) {
				const double seconds = quantity(body.substr(body.find_first_not_of("+-")));
				return (body.front() == '-' ? -seconds : seconds) * US_PER_SECOND;
			}

			double total = 0;
			size_t tokens = 0;
			auto it = body.cbegin();
			const auto end = body.cend();
			while (it != end) {
				boost::smatch m;
				if (boost::regex_search(it, end, m, separators, boost::match_continuous)) {
					it = m[0].second;
					if (it == end) break;
				}
				if (!boost::regex_search(it, end, m, token, boost::match_continuous)) {
					fail("unit tokens", "unexpected text \"" + std::string(it, end) + "\"");
					return std::nullopt;
				}
				std::string spelling = m[3].str();
				auto unit = duration_unit_from_alias(spelling);
				auto next = m[0].second;
				if (!unit && spelling.back() == '.') {
					// the period belongs to the text after the token
					spelling.pop_back();
					unit = duration_unit_from_alias(spelling);
					--next;
				}
				if (!unit) {
					fail("unit tokens", "unknown unit \"" + m[3].str() + "\"");
					return std::nullopt;
				}
				const double value =
					quantity(m[2].str()) * static_cast<double>(microseconds_per(*unit));
				total += m[1].str() == "-" ? -value : value;
				tokens++;
				it = next;
			}
			if (tokens == 0) {
				fail("unit tokens", "no duration tokens");
				return std::nullopt;
			}
			return total;
		}
	};
} // namespace

std::optional<DurationUnit>
UtcTimeKit::calendar::duration_unit_from_alias(const std::string &alias) {
	const std::string lower = to_lower_ascii(alias);
	for (const auto &entry : s_aliases)
		if (entry.spelling == lower) return entry.unit;
	return std::nullopt;
}

int64_t UtcTimeKit::calendar::microseconds_per(DurationUnit unit) noexcept {
	switch (unit) {
	case DurationUnit::week: return US_PER_WEEK;
	case DurationUnit::day: return US_PER_DAY;
	case DurationUnit::hour: return US_PER_HOUR;
	case DurationUnit::minute: return US_PER_MINUTE;
	case DurationUnit::second: return US_PER_SECOND;
	case DurationUnit::millisecond: return 1000;
	case DurationUnit::microsecond: return 1;
	}
	return 1;
}

Duration UtcTimeKit::calendar::parse_duration(const std::string &text) {
	std::string body{trim(text)};
	bool negative = false;
	if (!body.empty() && (body.front() == '-' || body.front() == '+')) {
		negative = body.front() == '-';
		body = std::string{trim(std::string_view{body}.substr(1))};
	}

	Grammar grammar{};
	std::optional<double> total{};
	if (body.empty())
		grammar.fail("unit tokens", "empty text");
	else if (body.find(':') != std::string::npos)
		total = grammar.clock(body);
	else
		total = grammar.units(body);

	if (!total) {
		log_verbose("no duration grammar matches \"", text, "\"");
		UTK_THROW_PARSE(text, grammar.attempts);
	}
	Duration::Units units{};
	units.microseconds = negative ? -*total : *total;
	return Duration::of(units);
}

Duration UtcTimeKit::calendar::parse_duration(double seconds) {
	return Duration::from_seconds(seconds);
}
