// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "UtcTimeKit/calendar/Instant.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

#include "UtcTimeKit/calendar/Common.hpp"
#include "low_level/civil.hpp"
#include "low_level/digits.hpp"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;
using namespace UtcTimeKit::calendar::source::low_level;
using namespace std::string_literals;

static constexpr int32_t s_min_year = 1;
static constexpr int32_t s_max_year = 9999;
static constexpr int64_t s_min_us = days_from_civil(s_min_year, 1, 1) * US_PER_DAY;
static constexpr int64_t s_max_us = days_from_civil(s_max_year + 1, 1, 1) * US_PER_DAY - 1;

static CivilTime to_civil(const Instant::Fields &f) {
	return CivilTime{f.year, f.month, f.day, f.hour, f.minute, f.second, f.microsecond};
}

static void validate(const Instant::Fields &f) {
	if (f.year < s_min_year || f.year > s_max_year)
		UTK_THROW(RangeOverflowError, "year " + std::to_string(f.year) + " is out of range");
	if (f.month < 1 || f.month > 12)
		UTK_THROW(InvalidValueError, "month must be in 1..12, not " + std::to_string(f.month));
	if (f.day < 1 || f.day > days_in_month(f.year, f.month))
		UTK_THROW(InvalidValueError, "day is out of range for month");
	if (f.hour > 23) UTK_THROW(InvalidValueError, "hour must be in 0..23");
	if (f.minute > 59) UTK_THROW(InvalidValueError, "minute must be in 0..59");
	if (f.second > 59) UTK_THROW(InvalidValueError, "second must be in 0..59");
	if (f.microsecond > 999'999) UTK_THROW(InvalidValueError, "microsecond must be in 0..999999");
}

Instant Instant::from_fields(const Fields &fields) {
	validate(fields);
	return Instant(microseconds_from_civil(to_civil(fields)));
}

Instant Instant::from_fields(int32_t year, uint32_t month, uint32_t day, uint32_t hour,
							 uint32_t minute, uint32_t second, uint32_t microsecond) {
	return from_fields(Fields{year, month, day, hour, minute, second, microsecond});
}

Instant Instant::from_microseconds(int64_t us_since_epoch) {
	if (us_since_epoch < s_min_us || us_since_epoch > s_max_us)
		UTK_THROW(RangeOverflowError, "instant is outside 0001-01-01..9999-12-31");
	return Instant(us_since_epoch);
}

Instant Instant::from_timestamp(double seconds) {
	if (!std::isfinite(seconds)) UTK_THROW(RangeOverflowError, "timestamp is not finite");
	const double whole = std::floor(seconds);
	if (whole < static_cast<double>(s_min_us / US_PER_SECOND) - 1 ||
		whole > static_cast<double>(s_max_us / US_PER_SECOND) + 1)
		UTK_THROW(RangeOverflowError, "timestamp is outside 0001-01-01..9999-12-31");
	const double fraction = std::nearbyint((seconds - whole) * static_cast<double>(US_PER_SECOND));
	return from_microseconds(static_cast<int64_t>(whole) * US_PER_SECOND +
							 static_cast<int64_t>(fraction));
}

Instant Instant::now() {
	const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
	return from_microseconds(
		std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count());
}

Instant Instant::min() noexcept {
	return Instant(s_min_us);
}

Instant Instant::max() noexcept {
	return Instant(s_max_us);
}

Instant::Fields Instant::fields() const noexcept {
	const CivilTime t = civil_from_microseconds(m_us);
	return Fields{t.year, t.month, t.day, t.hour, t.minute, t.second, t.microsecond};
}

int32_t Instant::year() const noexcept {
	return civil_from_days(floor_div(m_us, US_PER_DAY)).year;
}
uint32_t Instant::month() const noexcept {
	return civil_from_days(floor_div(m_us, US_PER_DAY)).month;
}
uint32_t Instant::day() const noexcept {
	return civil_from_days(floor_div(m_us, US_PER_DAY)).day;
}
uint32_t Instant::hour() const noexcept {
	return static_cast<uint32_t>(floor_mod(m_us, US_PER_DAY) / US_PER_HOUR);
}
uint32_t Instant::minute() const noexcept {
	return static_cast<uint32_t>(floor_mod(m_us, US_PER_HOUR) / US_PER_MINUTE);
}
uint32_t Instant::second() const noexcept {
	return static_cast<uint32_t>(floor_mod(m_us, US_PER_MINUTE) / US_PER_SECOND);
}
uint32_t Instant::microsecond() const noexcept {
	return static_cast<uint32_t>(floor_mod(m_us, US_PER_SECOND));
}

uint32_t Instant::isoweekday() const noexcept {
	return iso_weekday(floor_div(m_us, US_PER_DAY));
}

uint32_t Instant::day_of_year() const noexcept {
	const CivilDate d = civil_from_days(floor_div(m_us, US_PER_DAY));
	return source::low_level::day_of_year(d.year, d.month, d.day);
}

uint32_t Instant::days_in_month() const noexcept {
	const CivilDate d = civil_from_days(floor_div(m_us, US_PER_DAY));
	return source::low_level::days_in_month(d.year, d.month);
}

bool Instant::is_leap_year() const noexcept {
	return source::low_level::is_leap_year(year());
}

double Instant::timestamp() const noexcept {
	return static_cast<double>(floor_div(m_us, US_PER_SECOND)) +
		   static_cast<double>(floor_mod(m_us, US_PER_SECOND)) / static_cast<double>(US_PER_SECOND);
}

Instant Instant::with_year(int32_t year) const {
	auto f = fields();
	f.year = year;
	return from_fields(f);
}
Instant Instant::with_month(uint32_t month) const {
	auto f = fields();
	f.month = month;
	return from_fields(f);
}
Instant Instant::with_day(uint32_t day) const {
	auto f = fields();
	f.day = day;
	return from_fields(f);
}
Instant Instant::with_hour(uint32_t hour) const {
	auto f = fields();
	f.hour = hour;
	return from_fields(f);
}
Instant Instant::with_minute(uint32_t minute) const {
	auto f = fields();
	f.minute = minute;
	return from_fields(f);
}
Instant Instant::with_second(uint32_t second) const {
	auto f = fields();
	f.second = second;
	return from_fields(f);
}
Instant Instant::with_microsecond(uint32_t microsecond) const {
	auto f = fields();
	f.microsecond = microsecond;
	return from_fields(f);
}

static int64_t checked_mul(int64_t a, int64_t b) {
	int64_t r{};
	if (__builtin_mul_overflow(a, b, &r)) UTK_THROW(RangeOverflowError, "shift overflows");
	return r;
}

static int64_t checked_add(int64_t a, int64_t b) {
	int64_t r{};
	if (__builtin_add_overflow(a, b, &r)) UTK_THROW(RangeOverflowError, "shift overflows");
	return r;
}

Instant Instant::shift(const Shift &s) const {
	Fields f = fields();
	if (s.years != 0 || s.months != 0) {
		const int64_t month_index = checked_add(
			checked_add(int64_t{f.year} * 12 + (f.month - 1), checked_mul(s.years, 12)), s.months);
		const int64_t year = floor_div<int64_t>(month_index, 12);
		if (year < s_min_year || year > s_max_year)
			UTK_THROW(RangeOverflowError, "year " + std::to_string(year) + " is out of range");
		f.year = static_cast<int32_t>(year);
		f.month = static_cast<uint32_t>(floor_mod<int64_t>(month_index, 12)) + 1;
		f.day = std::min(f.day, source::low_level::days_in_month(f.year, f.month));
	}
	int64_t us = microseconds_from_civil(to_civil(f));
	us = checked_add(us, checked_mul(s.weeks, US_PER_WEEK));
	us = checked_add(us, checked_mul(s.days, US_PER_DAY));
	us = checked_add(us, checked_mul(s.hours, US_PER_HOUR));
	us = checked_add(us, checked_mul(s.minutes, US_PER_MINUTE));
	us = checked_add(us, checked_mul(s.seconds, US_PER_SECOND));
	us = checked_add(us, s.microseconds);
	return from_microseconds(us);
}

std::string Instant::isoformat() const {
	const Fields f = fields();
	std::string out;
	out.reserve(32);
	append_padded(out, f.year, 4);
	out.push_back('-');
	append_padded(out, f.month, 2);
	out.push_back('-');
	append_padded(out, f.day, 2);
	out.push_back('T');
	append_padded(out, f.hour, 2);
	out.push_back(':');
	append_padded(out, f.minute, 2);
	out.push_back(':');
	append_padded(out, f.second, 2);
	if (f.microsecond != 0) {
		out.push_back('.');
		append_padded(out, f.microsecond, 6);
	}
	out += "+00:00";
	return out;
}

Instant Instant::operator+(const Duration &d) const {
	int64_t us{};
	if (__builtin_add_overflow(m_us, d.total_microseconds(), &us))
		UTK_THROW(RangeOverflowError, "instant addition overflows");
	return from_microseconds(us);
}

Instant Instant::operator-(const Duration &d) const {
	int64_t us{};
	if (__builtin_sub_overflow(m_us, d.total_microseconds(), &us))
		UTK_THROW(RangeOverflowError, "instant subtraction overflows");
	return from_microseconds(us);
}

Duration Instant::operator-(const Instant &other) const noexcept {
	// both operands lie within years 1..9999, the difference always fits
	return Duration::from_microseconds(m_us - other.m_us);
}

std::ostream &UtcTimeKit::calendar::operator<<(std::ostream &os, const Instant &t) {
	return os << t.isoformat();
}
