// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#pragma once

#include <cstdint>

#include "inline.hpp"

namespace UtcTimeKit::calendar::source::low_level {

	inline constexpr int64_t US_PER_SECOND = 1'000'000LL;
	inline constexpr int64_t US_PER_MINUTE = 60LL * US_PER_SECOND;
	inline constexpr int64_t US_PER_HOUR = 60LL * US_PER_MINUTE;
	inline constexpr int64_t US_PER_DAY = 24LL * US_PER_HOUR;
	inline constexpr int64_t US_PER_WEEK = 7LL * US_PER_DAY;
	inline constexpr int64_t SECONDS_PER_DAY = 86'400LL;

	struct CivilDate {
		int32_t year;
		uint32_t month; // [1, 12]
		uint32_t day;	// [1, 31]
	};

	struct CivilTime {
		int32_t year;
		uint32_t month;
		uint32_t day;
		uint32_t hour;
		uint32_t minute;
		uint32_t second;
		uint32_t microsecond;
	};

	CONST_INLINE constexpr bool is_leap_year(int64_t y) noexcept {
		return (y % 4 == 0) && ((y % 100 != 0) || (y % 400 == 0));
	}

	CONST_INLINE constexpr uint32_t days_in_month(int64_t y, uint32_t m) noexcept {
		constexpr uint8_t lengths[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
		if (m == 2 && is_leap_year(y)) return 29;
		return lengths[(m - 1) % 12];
	}

	CONST_INLINE constexpr uint32_t days_in_year(int64_t y) noexcept {
		return is_leap_year(y) ? 366 : 365;
	}

	// Days since 1970-01-01 for a proleptic Gregorian date.
	// Howard Hinnant's days_from_civil: http://howardhinnant.github.io/date_algorithms.html
	CONST_INLINE constexpr int64_t days_from_civil(int64_t y, uint32_t m, uint32_t d) noexcept {
		y -= m <= 2 ? 1 : 0;
		const int64_t era = (y >= 0 ? y : y - 399) / 400;
		const uint32_t yoe = static_cast<uint32_t>(y - era * 400);			   // [0, 399]
		const uint32_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1; // [0, 365]
		const uint32_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;			   // [0, 146096]
		return era * 146097 + static_cast<int64_t>(doe) - 719468;
	}

	// Inverse of days_from_civil.
	CONST_INLINE constexpr CivilDate civil_from_days(int64_t days) noexcept {
		// shift epoch from 1970-01-01 to 0000-03-01 (eliminates leap year special case)
		days += 719468;
		const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
		const uint32_t doe = static_cast<uint32_t>(days - era * 146097);
		const uint32_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
		const int64_t y = static_cast<int64_t>(yoe) + era * 400;
		const uint32_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
		const uint32_t mp = (5 * doy + 2) / 153;
		CivilDate date{};
		date.day = doy - (153 * mp + 2) / 5 + 1;
		date.month = mp < 10 ? mp + 3 : mp - 9;
		date.year = static_cast<int32_t>(y + (date.month <= 2 ? 1 : 0));
		return date;
	}

	// ISO weekday of a day count, 1 = Monday ... 7 = Sunday (1970-01-01 was a Thursday)
	CONST_INLINE constexpr uint32_t iso_weekday(int64_t days) noexcept {
		return static_cast<uint32_t>(floor_mod<int64_t>(days + 3, 7)) + 1;
	}

	CONST_INLINE constexpr uint32_t day_of_year(int64_t y, uint32_t m, uint32_t d) noexcept {
		return static_cast<uint32_t>(days_from_civil(y, m, d) - days_from_civil(y, 1, 1)) + 1;
	}

	CONST_INLINE constexpr CivilTime civil_from_microseconds(int64_t us) noexcept {
		const int64_t days = floor_div(us, US_PER_DAY);
		int64_t rest = us - days * US_PER_DAY;
		const CivilDate date = civil_from_days(days);
		CivilTime t{};
		t.year = date.year;
		t.month = date.month;
		t.day = date.day;
		t.hour = static_cast<uint32_t>(rest / US_PER_HOUR);
		rest %= US_PER_HOUR;
		t.minute = static_cast<uint32_t>(rest / US_PER_MINUTE);
		rest %= US_PER_MINUTE;
		t.second = static_cast<uint32_t>(rest / US_PER_SECOND);
		t.microsecond = static_cast<uint32_t>(rest % US_PER_SECOND);
		return t;
	}

	INLINE constexpr int64_t microseconds_from_civil(const CivilTime &t) noexcept {
		return days_from_civil(t.year, t.month, t.day) * US_PER_DAY +
			   static_cast<int64_t>(t.hour) * US_PER_HOUR +
			   static_cast<int64_t>(t.minute) * US_PER_MINUTE +
			   static_cast<int64_t>(t.second) * US_PER_SECOND + t.microsecond;
	}

	static_assert(days_from_civil(1970, 1, 1) == 0);
	static_assert(days_from_civil(2000, 3, 1) == 11017);
	static_assert(civil_from_days(11017).month == 3);
	static_assert(iso_weekday(0) == 4);
	static_assert(day_of_year(2016, 12, 31) == 366);

} // namespace UtcTimeKit::calendar::source::low_level
