// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef UTK_CALENDAR_DURATION_HEADER
#define UTK_CALENDAR_DURATION_HEADER

#include <compare>
#include <cstdint>
#include <ostream>
#include <string>

#include "Common.hpp"

namespace UtcTimeKit::calendar {

	/**
	 * @brief Immutable signed elapsed time with microsecond resolution
	 *
	 * The canonical value is the total number of microseconds. The normalized display
	 * components follow the usual duration convention: days() carries the sign while
	 * seconds() and microseconds() are always non-negative.
	 */
	class EXPORT Duration final {
	  public:
		// Quantities summed in floating point before rounding to the microsecond.
		struct Units {
			double weeks = 0;
			double days = 0;
			double hours = 0;
			double minutes = 0;
			double seconds = 0;
			double milliseconds = 0;
			double microseconds = 0;
		};

		// Magnitude broken down for display; the sign is kept separately.
		struct Components {
			bool negative;
			int64_t weeks;
			int64_t days; // [0, 6]
			uint32_t hours;
			uint32_t minutes;
			uint32_t seconds;
			uint32_t microseconds;
		};

		constexpr Duration() noexcept = default;

		static constexpr Duration from_microseconds(int64_t us) noexcept { return Duration(us); }
		static Duration from_seconds(double seconds);
		static Duration of(const Units &units);

		static constexpr Duration resolution() noexcept { return Duration(1); }

		[[nodiscard]] constexpr int64_t total_microseconds() const noexcept { return m_us; }
		[[nodiscard]] double total_seconds() const noexcept;

		[[nodiscard]] int64_t days() const noexcept;
		[[nodiscard]] uint32_t seconds() const noexcept;
		[[nodiscard]] uint32_t microseconds() const noexcept;
		[[nodiscard]] Components components() const noexcept;

		[[nodiscard]] bool is_negative() const noexcept { return m_us < 0; }
		[[nodiscard]] bool is_zero() const noexcept { return m_us == 0; }

		// "10 days, 2:32:00", "0:00:05.250000", "-1 day, 0:00:00"
		[[nodiscard]] std::string to_string() const;

		Duration operator+(const Duration &other) const;
		Duration operator-(const Duration &other) const;
		Duration operator-() const;
		Duration operator*(int64_t factor) const;
		Duration operator*(double factor) const;
		Duration operator/(int64_t divisor) const;
		double operator/(const Duration &other) const;

		[[nodiscard]] Duration abs() const;

		constexpr auto operator<=>(const Duration &) const noexcept = default;
		constexpr bool operator==(const Duration &) const noexcept = default;

	  private:
		explicit constexpr Duration(int64_t us) noexcept
			: m_us(us) {}
		int64_t m_us{0};
	};

	inline Duration operator*(int64_t factor, const Duration &d) { return d * factor; }

	EXPORT std::ostream &operator<<(std::ostream &os, const Duration &d);

} // namespace UtcTimeKit::calendar

#endif
