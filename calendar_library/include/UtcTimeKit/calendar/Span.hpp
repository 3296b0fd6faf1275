// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef UTK_CALENDAR_SPAN_HEADER
#define UTK_CALENDAR_SPAN_HEADER

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Common.hpp"
#include "Instant.hpp"

namespace UtcTimeKit::calendar {

	enum class SpanUnit { second, minute, hour, day, week, month, year, decade, century };

	// "second" ... "century", case-insensitive; @throws InvalidUnitError
	EXPORT SpanUnit span_unit_from_string(const std::string &name);
	EXPORT std::string_view to_string(SpanUnit unit) noexcept;

	struct SpanBoundary {
		Instant start;
		Instant end; // last microsecond inside the span
		bool operator==(const SpanBoundary &) const noexcept = default;
	};

	/**
	 * @brief Lower boundary of the unit containing the instant
	 *
	 * Weeks start on Monday, decades and centuries on years divisible by 10 and 100.
	 * @throws RangeOverflowError when the boundary lies before year 1
	 */
	EXPORT Instant start_of(SpanUnit unit, const Instant &instant);

	/**
	 * @brief One microsecond before start_of(unit, instant) advanced by count units
	 * @throws InvalidValueError for count < 1
	 */
	EXPORT Instant end_of(SpanUnit unit, const Instant &instant, int64_t count = 1);

	EXPORT SpanBoundary span(SpanUnit unit, const Instant &instant, int64_t count = 1);

	// calendar step of n units; months and years clamp the day to the target month
	EXPORT Instant shift_by(SpanUnit unit, const Instant &instant, int64_t n);

	/**
	 * @brief Lazy, restartable sequence stepping count units at a time
	 *
	 * Each element is shift_by(unit, previous, count), so a month step that clamps the day
	 * keeps the clamped day from then on (Jan 31, Feb 29, Mar 29). The sequence ends before
	 * the first element whose start is at or after the end instant, or whose start cannot be
	 * represented.
	 */
	template <typename Value> class EXPORT StepSequence final {
	  public:
		class iterator {
		  public:
			using iterator_category = std::input_iterator_tag;
			using value_type = Value;
			using difference_type = std::ptrdiff_t;
			using pointer = const Value *;
			using reference = const Value &;

			iterator() = default;

			reference operator*() const noexcept { return *m_current; }
			pointer operator->() const noexcept { return &*m_current; }
			iterator &operator++() {
				m_current = m_sequence->after(*m_current);
				return *this;
			}
			iterator operator++(int) {
				iterator copy = *this;
				++*this;
				return copy;
			}
			friend bool operator==(const iterator &it, std::default_sentinel_t) noexcept {
				return !it.m_current.has_value();
			}

		  private:
			friend class StepSequence;
			explicit iterator(const StepSequence *sequence)
				: m_sequence(sequence)
				, m_current(sequence->first()) {}

			const StepSequence *m_sequence = nullptr;
			std::optional<Value> m_current{};
		};

		// @throws InvalidValueError for count < 1
		StepSequence(SpanUnit unit, const Instant &start, const Instant &end, int64_t count);

		iterator begin() const { return iterator{this}; }
		std::default_sentinel_t end() const noexcept { return {}; }

		[[nodiscard]] std::vector<Value> to_vector() const {
			std::vector<Value> out{};
			for (const Value &value : *this) out.push_back(value);
			return out;
		}

		[[nodiscard]] SpanUnit unit() const noexcept { return m_unit; }
		[[nodiscard]] int64_t count() const noexcept { return m_count; }

	  private:
		std::optional<Value> first() const;
		std::optional<Value> after(const Value &previous) const;

		SpanUnit m_unit;
		Instant m_origin;
		Instant m_end;
		int64_t m_count;
	};

	using InstantRange = StepSequence<Instant>;
	using SpanRange = StepSequence<SpanBoundary>;

	template <> std::optional<Instant> StepSequence<Instant>::first() const;
	template <> std::optional<Instant> StepSequence<Instant>::after(const Instant &previous) const;
	template <> std::optional<SpanBoundary> StepSequence<SpanBoundary>::first() const;
	template <>
	std::optional<SpanBoundary> StepSequence<SpanBoundary>::after(const SpanBoundary &previous) const;

	extern template class StepSequence<Instant>;
	extern template class StepSequence<SpanBoundary>;

	// instants from start itself, in steps of count units, before end
	EXPORT InstantRange range(SpanUnit unit, const Instant &start, const Instant &end,
							  int64_t count = 1);
	// spans of count units from start_of(unit, start), beginning before end
	EXPORT SpanRange span_range(SpanUnit unit, const Instant &start, const Instant &end,
								int64_t count = 1);

} // namespace UtcTimeKit::calendar

#endif
