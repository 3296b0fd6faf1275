// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef UTK_CALENDAR_INSTANT_HEADER
#define UTK_CALENDAR_INSTANT_HEADER

#include <compare>
#include <cstdint>
#include <ostream>
#include <string>

#include "Common.hpp"
#include "Duration.hpp"

namespace UtcTimeKit::calendar {

	/**
	 * @brief Immutable UTC point in time with microsecond resolution
	 *
	 * Stored as microseconds since 1970-01-01T00:00:00Z and limited to the proleptic Gregorian
	 * years 1 to 9999. An Instant never carries a UTC offset; conversions to other zones happen
	 * only when parsing or formatting.
	 */
	class EXPORT Instant final {
	  public:
		struct Fields {
			int32_t year = 1970;
			uint32_t month = 1;
			uint32_t day = 1;
			uint32_t hour = 0;
			uint32_t minute = 0;
			uint32_t second = 0;
			uint32_t microsecond = 0;
		};

		// Calendar shift: years and months first (day clamped to the month length), the rest
		// as exact elapsed time.
		struct Shift {
			int64_t years = 0;
			int64_t months = 0;
			int64_t weeks = 0;
			int64_t days = 0;
			int64_t hours = 0;
			int64_t minutes = 0;
			int64_t seconds = 0;
			int64_t microseconds = 0;
		};

		constexpr Instant() noexcept = default;

		/**
		 * @brief Build from civil UTC fields
		 * @throws InvalidValueError for a field outside its range (e.g. February 30)
		 * @throws RangeOverflowError for a year outside [1, 9999]
		 */
		static Instant from_fields(const Fields &fields);
		static Instant from_fields(int32_t year, uint32_t month, uint32_t day, uint32_t hour = 0,
								   uint32_t minute = 0, uint32_t second = 0,
								   uint32_t microsecond = 0);
		static Instant from_microseconds(int64_t us_since_epoch);
		// POSIX seconds, rounded half-even to the microsecond
		static Instant from_timestamp(double seconds);
		static Instant now();

		static Instant min() noexcept;
		static Instant max() noexcept;
		static constexpr Instant epoch() noexcept { return Instant(); }

		[[nodiscard]] Fields fields() const noexcept;
		[[nodiscard]] int32_t year() const noexcept;
		[[nodiscard]] uint32_t month() const noexcept;
		[[nodiscard]] uint32_t day() const noexcept;
		[[nodiscard]] uint32_t hour() const noexcept;
		[[nodiscard]] uint32_t minute() const noexcept;
		[[nodiscard]] uint32_t second() const noexcept;
		[[nodiscard]] uint32_t microsecond() const noexcept;

		[[nodiscard]] uint32_t isoweekday() const noexcept; // 1 = Monday
		[[nodiscard]] uint32_t day_of_year() const noexcept;
		[[nodiscard]] uint32_t days_in_month() const noexcept;
		[[nodiscard]] bool is_leap_year() const noexcept;

		[[nodiscard]] constexpr int64_t microseconds_since_epoch() const noexcept { return m_us; }
		[[nodiscard]] double timestamp() const noexcept;

		[[nodiscard]] Instant replace(const Fields &fields) const { return from_fields(fields); }
		[[nodiscard]] Instant with_year(int32_t year) const;
		[[nodiscard]] Instant with_month(uint32_t month) const;
		[[nodiscard]] Instant with_day(uint32_t day) const;
		[[nodiscard]] Instant with_hour(uint32_t hour) const;
		[[nodiscard]] Instant with_minute(uint32_t minute) const;
		[[nodiscard]] Instant with_second(uint32_t second) const;
		[[nodiscard]] Instant with_microsecond(uint32_t microsecond) const;

		[[nodiscard]] Instant shift(const Shift &shift) const;

		// "2016-07-25T19:33:18+00:00", with ".ffffff" when the microsecond is not zero
		[[nodiscard]] std::string isoformat() const;

		[[nodiscard]] bool is_before(const Instant &other) const noexcept { return *this < other; }
		[[nodiscard]] bool is_on_or_before(const Instant &other) const noexcept {
			return *this <= other;
		}
		[[nodiscard]] bool is_after(const Instant &other) const noexcept { return *this > other; }
		[[nodiscard]] bool is_on_or_after(const Instant &other) const noexcept {
			return *this >= other;
		}
		[[nodiscard]] bool is_between(const Instant &start, const Instant &end) const noexcept {
			return start <= *this && *this <= end;
		}

		Instant operator+(const Duration &d) const;
		Instant operator-(const Duration &d) const;
		Duration operator-(const Instant &other) const noexcept;

		constexpr auto operator<=>(const Instant &) const noexcept = default;
		constexpr bool operator==(const Instant &) const noexcept = default;

	  private:
		explicit constexpr Instant(int64_t us) noexcept
			: m_us(us) {}
		int64_t m_us{0};
	};

	EXPORT std::ostream &operator<<(std::ostream &os, const Instant &t);

} // namespace UtcTimeKit::calendar

#endif
