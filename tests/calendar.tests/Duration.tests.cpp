// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include <limits>
#include <sstream>
#include <string>

#include "UtcTimeKit/calendar/Duration.hpp"
#include "gtest/gtest.h"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;

class calendar_Duration : public ::testing::Test
{
  protected:
	static Duration seconds(double s) { return Duration::from_seconds(s); }
};

TEST_F(calendar_Duration, display)
{
	EXPECT_EQ(seconds(873120).to_string(), "10 days, 2:32:00");
	EXPECT_EQ(seconds(86400).to_string(), "1 day, 0:00:00");
	EXPECT_EQ(seconds(5.25).to_string(), "0:00:05.250000");
	EXPECT_EQ(seconds(-86400).to_string(), "-1 day, 0:00:00");
	EXPECT_EQ(seconds(-1).to_string(), "-0:00:01");
	EXPECT_EQ(Duration{}.to_string(), "0:00:00");
	std::ostringstream os;
	os << seconds(9120);
	EXPECT_EQ(os.str(), "2:32:00");
}

TEST_F(calendar_Duration, normalized_parts)
{
	const Duration d = seconds(-1);
	EXPECT_EQ(d.days(), -1);
	EXPECT_EQ(d.seconds(), 86399u);
	EXPECT_EQ(d.microseconds(), 0u);
	EXPECT_TRUE(d.is_negative());

	const auto c = seconds(873120.5).components();
	EXPECT_FALSE(c.negative);
	EXPECT_EQ(c.weeks, 1);
	EXPECT_EQ(c.days, 3);
	EXPECT_EQ(c.hours, 2u);
	EXPECT_EQ(c.minutes, 32u);
	EXPECT_EQ(c.seconds, 0u);
	EXPECT_EQ(c.microseconds, 500000u);
}

TEST_F(calendar_Duration, of_units_rounds_half_even)
{
	EXPECT_EQ(Duration::of({.weeks = 1, .days = 3, .hours = 2, .minutes = 32}), seconds(873120));
	EXPECT_EQ(Duration::of({.microseconds = 0.5}).total_microseconds(), 0);
	EXPECT_EQ(Duration::of({.microseconds = 1.5}).total_microseconds(), 2);
	EXPECT_EQ(Duration::of({.milliseconds = 1}).total_microseconds(), 1000);
	EXPECT_DOUBLE_EQ(seconds(2.266).total_seconds(), 2.266);
}

TEST_F(calendar_Duration, arithmetic)
{
	EXPECT_EQ(seconds(1) + seconds(2), seconds(3));
	EXPECT_EQ(seconds(1) - seconds(2), seconds(-1));
	EXPECT_EQ(-seconds(5), seconds(-5));
	EXPECT_EQ(seconds(3) * int64_t{2}, seconds(6));
	EXPECT_EQ(int64_t{2} * seconds(3), seconds(6));
	EXPECT_EQ(seconds(1) * 0.5, seconds(0.5));
	EXPECT_EQ(Duration::from_microseconds(-3) / int64_t{2}, Duration::from_microseconds(-2));
	EXPECT_DOUBLE_EQ(seconds(9120) / seconds(60), 152.0);
	EXPECT_EQ(seconds(-7).abs(), seconds(7));
	EXPECT_LT(seconds(-1), Duration{});
}

TEST_F(calendar_Duration, overflow_and_division_errors)
{
	const Duration largest = Duration::from_microseconds(std::numeric_limits<int64_t>::max());
	EXPECT_THROW(largest + Duration::resolution(), RangeOverflowError);
	EXPECT_THROW(largest * int64_t{2}, RangeOverflowError);
	EXPECT_THROW(-Duration::from_microseconds(std::numeric_limits<int64_t>::min()),
				 RangeOverflowError);
	EXPECT_THROW(seconds(1) / int64_t{0}, InvalidValueError);
	EXPECT_THROW(seconds(1) / Duration{}, InvalidValueError);
	EXPECT_THROW(Duration::from_seconds(std::numeric_limits<double>::infinity()),
				 RangeOverflowError);
}
