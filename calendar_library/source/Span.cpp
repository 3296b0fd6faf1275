// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "UtcTimeKit/calendar/Span.hpp"

#include <algorithm>
#include <type_traits>

#include "low_level/civil.hpp"
#include "low_level/text.hpp"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;
using namespace UtcTimeKit::calendar::source::low_level;

namespace {
	constexpr std::string_view s_unit_names[] = {"second", "minute", "hour",   "day",	 "week",
												 "month",  "year",	 "decade", "century"};

	// raw results stay within the years 0..10000, one year beyond the Instant range each way
	constexpr int64_t s_lowest_year = 0;
	constexpr int64_t s_highest_year = 10'000;

	int64_t years_per(SpanUnit unit) noexcept {
		switch (unit) {
		case SpanUnit::year: return 1;
		case SpanUnit::decade: return 10;
		case SpanUnit::century: return 100;
		default: return 0;
		}
	}

	int64_t exact_microseconds_per(SpanUnit unit) noexcept {
		switch (unit) {
		case SpanUnit::second: return US_PER_SECOND;
		case SpanUnit::minute: return US_PER_MINUTE;
		case SpanUnit::hour: return US_PER_HOUR;
		case SpanUnit::day: return US_PER_DAY;
		case SpanUnit::week: return US_PER_WEEK;
		default: return 0;
		}
	}

	/**
	 * @brief Microseconds since the epoch of instant advanced by n units
	 *
	 * Not bounded to the Instant range so that a boundary one microsecond past
	 * year 9999 can still be named.
	 * @return nullopt when the result lies outside the years 0..10000
	 */
	std::optional<int64_t> raw_shift(SpanUnit unit, const Instant &instant, int64_t n) {
		const int64_t origin = instant.microseconds_since_epoch();
		if (const int64_t step = exact_microseconds_per(unit)) {
			int64_t delta{};
			int64_t out{};
			if (__builtin_mul_overflow(n, step, &delta) || __builtin_add_overflow(origin, delta, &out))
				return std::nullopt;
			return out;
		}

		int64_t months{};
		if (unit == SpanUnit::month) months = n;
		else if (__builtin_mul_overflow(n, years_per(unit) * 12, &months))
			return std::nullopt;

		CivilTime t = civil_from_microseconds(origin);
		int64_t index{};
		if (__builtin_add_overflow(int64_t{t.year} * 12 + (t.month - 1), months, &index))
			return std::nullopt;
		const int64_t year = floor_div<int64_t>(index, 12);
		if (year < s_lowest_year || year > s_highest_year) return std::nullopt;
		t.year = static_cast<int32_t>(year);
		t.month = static_cast<uint32_t>(floor_mod<int64_t>(index, 12)) + 1;
		t.day = std::min(t.day, days_in_month(t.year, t.month));
		return microseconds_from_civil(t);
	}

	Instant bounded(std::optional<int64_t> us) {
		if (!us) UTK_THROW(RangeOverflowError, "result is out of range");
		return Instant::from_microseconds(*us);
	}

	void check_count(int64_t count) {
		if (count < 1)
			UTK_THROW(InvalidValueError, "count must be at least 1, got " + std::to_string(count));
	}
} // namespace

// ====================================================================================================
// units
// ====================================================================================================

SpanUnit UtcTimeKit::calendar::span_unit_from_string(const std::string &name) {
	const std::string lower = to_lower_ascii(name);
	for (size_t i = 0; i < std::size(s_unit_names); i++)
		if (s_unit_names[i] == lower) return static_cast<SpanUnit>(i);
	UTK_THROW(InvalidUnitError, "unknown time frame \"" + name + "\"");
}

std::string_view UtcTimeKit::calendar::to_string(SpanUnit unit) noexcept {
	return s_unit_names[static_cast<size_t>(unit)];
}

// ====================================================================================================
// boundaries
// ====================================================================================================

Instant UtcTimeKit::calendar::start_of(SpanUnit unit, const Instant &instant) {
	Instant::Fields f = instant.fields();
	f.microsecond = 0;
	if (unit == SpanUnit::second) return Instant::from_fields(f);
	f.second = 0;
	if (unit == SpanUnit::minute) return Instant::from_fields(f);
	f.minute = 0;
	if (unit == SpanUnit::hour) return Instant::from_fields(f);
	f.hour = 0;
	if (unit == SpanUnit::day) return Instant::from_fields(f);
	if (unit == SpanUnit::week)
		return Instant::from_fields(f).shift(
			Instant::Shift{.days = -static_cast<int64_t>(instant.isoweekday() - 1)});
	f.day = 1;
	if (unit == SpanUnit::month) return Instant::from_fields(f);
	f.month = 1;
	if (unit == SpanUnit::decade) f.year = floor_div<int32_t>(f.year, 10) * 10;
	else if (unit == SpanUnit::century) f.year = floor_div<int32_t>(f.year, 100) * 100;
	return Instant::from_fields(f);
}

Instant UtcTimeKit::calendar::end_of(SpanUnit unit, const Instant &instant, int64_t count) {
	check_count(count);
	const auto next = raw_shift(unit, start_of(unit, instant), count);
	return bounded(next ? std::optional<int64_t>{*next - 1} : std::nullopt);
}

SpanBoundary UtcTimeKit::calendar::span(SpanUnit unit, const Instant &instant, int64_t count) {
	return SpanBoundary{start_of(unit, instant), end_of(unit, instant, count)};
}

Instant UtcTimeKit::calendar::shift_by(SpanUnit unit, const Instant &instant, int64_t n) {
	return bounded(raw_shift(unit, instant, n));
}

// ====================================================================================================
// sequences
// ====================================================================================================

namespace UtcTimeKit::calendar {

	template <typename Value>
	StepSequence<Value>::StepSequence(SpanUnit unit, const Instant &start, const Instant &end,
									  int64_t count)
		: m_unit(unit)
		, m_origin(start)
		, m_end(end)
		, m_count(count) {
		check_count(count);
		if constexpr (std::is_same_v<Value, SpanBoundary>) {
			m_origin = start_of(unit, start);
			if (end < start) m_end = m_origin; // nothing to step over
		}
	}

	template <> std::optional<Instant> StepSequence<Instant>::first() const {
		if (m_origin >= m_end) return std::nullopt;
		return m_origin;
	}

	template <>
	std::optional<Instant> StepSequence<Instant>::after(const Instant &previous) const {
		const auto us = raw_shift(m_unit, previous, m_count);
		if (!us || *us >= m_end.microseconds_since_epoch()) return std::nullopt;
		return Instant::from_microseconds(*us);
	}

	template <> std::optional<SpanBoundary> StepSequence<SpanBoundary>::first() const {
		if (m_origin >= m_end) return std::nullopt;
		return SpanBoundary{m_origin, end_of(m_unit, m_origin, m_count)};
	}

	template <>
	std::optional<SpanBoundary>
	StepSequence<SpanBoundary>::after(const SpanBoundary &previous) const {
		const auto us = raw_shift(m_unit, previous.start, m_count);
		if (!us || *us >= m_end.microseconds_since_epoch()) return std::nullopt;
		const Instant start = Instant::from_microseconds(*us);
		return SpanBoundary{start, end_of(m_unit, start, m_count)};
	}

	template class StepSequence<Instant>;
	template class StepSequence<SpanBoundary>;

} // namespace UtcTimeKit::calendar

InstantRange UtcTimeKit::calendar::range(SpanUnit unit, const Instant &start, const Instant &end,
										 int64_t count) {
	return InstantRange{unit, start, end, count};
}

SpanRange UtcTimeKit::calendar::span_range(SpanUnit unit, const Instant &start, const Instant &end,
										   int64_t count) {
	return SpanRange{unit, start, end, count};
}
