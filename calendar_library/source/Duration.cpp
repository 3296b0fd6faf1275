// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "UtcTimeKit/calendar/Duration.hpp"

#include <cmath>
#include <limits>

#include "UtcTimeKit/calendar/Common.hpp"
#include "low_level/civil.hpp"
#include "low_level/digits.hpp"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;
using namespace UtcTimeKit::calendar::source::low_level;

static int64_t round_microseconds(double us) {
	if (!std::isfinite(us)) UTK_THROW(RangeOverflowError, "duration is not finite");
	// nearbyint rounds half to even in the default rounding mode
	const double rounded = std::nearbyint(us);
	if (rounded >= 9.2233720368547758e18 || rounded < -9.2233720368547758e18)
		UTK_THROW(RangeOverflowError, "duration exceeds the representable range");
	return static_cast<int64_t>(rounded);
}

Duration Duration::from_seconds(double seconds) {
	return Duration(round_microseconds(seconds * static_cast<double>(US_PER_SECOND)));
}

Duration Duration::of(const Units &units) {
	const double total = units.weeks * static_cast<double>(US_PER_WEEK) +
						 units.days * static_cast<double>(US_PER_DAY) +
						 units.hours * static_cast<double>(US_PER_HOUR) +
						 units.minutes * static_cast<double>(US_PER_MINUTE) +
						 units.seconds * static_cast<double>(US_PER_SECOND) +
						 units.milliseconds * 1000.0 + units.microseconds;
	return Duration(round_microseconds(total));
}

double Duration::total_seconds() const noexcept {
	// split to keep the fractional part exact for large values
	const int64_t whole = m_us / US_PER_SECOND;
	const int64_t fraction = m_us % US_PER_SECOND;
	return static_cast<double>(whole) +
		   static_cast<double>(fraction) / static_cast<double>(US_PER_SECOND);
}

int64_t Duration::days() const noexcept {
	return floor_div(m_us, US_PER_DAY);
}

uint32_t Duration::seconds() const noexcept {
	return static_cast<uint32_t>(floor_mod(m_us, US_PER_DAY) / US_PER_SECOND);
}

uint32_t Duration::microseconds() const noexcept {
	return static_cast<uint32_t>(floor_mod(m_us, US_PER_SECOND));
}

Duration::Components Duration::components() const noexcept {
	Components c{};
	c.negative = m_us < 0;
	uint64_t rest =
		c.negative ? static_cast<uint64_t>(-(m_us + 1)) + 1 : static_cast<uint64_t>(m_us);
	c.weeks = static_cast<int64_t>(rest / US_PER_WEEK);
	rest %= US_PER_WEEK;
	c.days = static_cast<int64_t>(rest / US_PER_DAY);
	rest %= US_PER_DAY;
	c.hours = static_cast<uint32_t>(rest / US_PER_HOUR);
	rest %= US_PER_HOUR;
	c.minutes = static_cast<uint32_t>(rest / US_PER_MINUTE);
	rest %= US_PER_MINUTE;
	c.seconds = static_cast<uint32_t>(rest / US_PER_SECOND);
	c.microseconds = static_cast<uint32_t>(rest % US_PER_SECOND);
	return c;
}

std::string Duration::to_string() const {
	const Components c = components();
	const int64_t days = c.weeks * 7 + c.days;
	std::string out;
	if (c.negative) out.push_back('-');
	if (days != 0) {
		append_padded(out, days, 1);
		out += days == 1 ? " day, " : " days, ";
	}
	append_padded(out, c.hours, 1);
	out.push_back(':');
	append_padded(out, c.minutes, 2);
	out.push_back(':');
	append_padded(out, c.seconds, 2);
	if (c.microseconds != 0) {
		out.push_back('.');
		append_padded(out, c.microseconds, 6);
	}
	return out;
}

Duration Duration::operator+(const Duration &other) const {
	int64_t result{};
	if (__builtin_add_overflow(m_us, other.m_us, &result))
		UTK_THROW(RangeOverflowError, "duration addition overflows");
	return Duration(result);
}

Duration Duration::operator-(const Duration &other) const {
	int64_t result{};
	if (__builtin_sub_overflow(m_us, other.m_us, &result))
		UTK_THROW(RangeOverflowError, "duration subtraction overflows");
	return Duration(result);
}

Duration Duration::operator-() const {
	if (m_us == std::numeric_limits<int64_t>::min())
		UTK_THROW(RangeOverflowError, "duration negation overflows");
	return Duration(-m_us);
}

Duration Duration::operator*(int64_t factor) const {
	int64_t result{};
	if (__builtin_mul_overflow(m_us, factor, &result))
		UTK_THROW(RangeOverflowError, "duration multiplication overflows");
	return Duration(result);
}

Duration Duration::operator*(double factor) const {
	return Duration(round_microseconds(static_cast<double>(m_us) * factor));
}

Duration Duration::operator/(int64_t divisor) const {
	if (divisor == 0) UTK_THROW(InvalidValueError, "duration division by zero");
	if (m_us == std::numeric_limits<int64_t>::min() && divisor == -1)
		UTK_THROW(RangeOverflowError, "duration division overflows");
	int64_t q = m_us / divisor;
	if ((m_us % divisor != 0) && ((m_us < 0) != (divisor < 0))) q -= 1;
	return Duration(q);
}

double Duration::operator/(const Duration &other) const {
	if (other.m_us == 0) UTK_THROW(InvalidValueError, "duration division by zero");
	return static_cast<double>(m_us) / static_cast<double>(other.m_us);
}

Duration Duration::abs() const {
	return m_us < 0 ? -*this : *this;
}

std::ostream &UtcTimeKit::calendar::operator<<(std::ostream &os, const Duration &d) {
	return os << d.to_string();
}
