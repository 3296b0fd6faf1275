// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include <sstream>
#include <string>

#include "UtcTimeKit/calendar/Instant.hpp"
#include "helper.hpp"
#include "gtest/gtest.h"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;

class calendar_Instant : public ::testing::Test
{
};

TEST_F(calendar_Instant, fields)
{
	const Instant t = at(2015, 4, 4, 12, 30, 37, 651839);
	EXPECT_EQ(t.year(), 2015);
	EXPECT_EQ(t.month(), 4u);
	EXPECT_EQ(t.day(), 4u);
	EXPECT_EQ(t.hour(), 12u);
	EXPECT_EQ(t.minute(), 30u);
	EXPECT_EQ(t.second(), 37u);
	EXPECT_EQ(t.microsecond(), 651839u);
	EXPECT_EQ(t.isoweekday(), 6u);
	EXPECT_EQ(t.day_of_year(), 94u);
	EXPECT_EQ(t.days_in_month(), 30u);
	EXPECT_FALSE(t.is_leap_year());
}

TEST_F(calendar_Instant, epoch_and_bounds)
{
	EXPECT_EQ(Instant::epoch().microseconds_since_epoch(), 0);
	EXPECT_EQ(Instant{}, Instant::epoch());
	EXPECT_EQ(Instant::min().isoformat(), "0001-01-01T00:00:00+00:00");
	EXPECT_EQ(Instant::max().isoformat(), "9999-12-31T23:59:59.999999+00:00");
	EXPECT_THROW(Instant::from_microseconds(Instant::max().microseconds_since_epoch() + 1),
				 RangeOverflowError);
	EXPECT_THROW(Instant::from_microseconds(Instant::min().microseconds_since_epoch() - 1),
				 RangeOverflowError);
}

TEST_F(calendar_Instant, invalid_fields)
{
	EXPECT_THROW(at(2015, 2, 29), InvalidValueError);
	EXPECT_THROW(at(2015, 13, 1), InvalidValueError);
	EXPECT_THROW(at(2015, 1, 1, 24), InvalidValueError);
	EXPECT_THROW(at(0, 1, 1), RangeOverflowError);
	EXPECT_THROW(at(10000, 1, 1), RangeOverflowError);
	EXPECT_NO_THROW(at(2016, 2, 29));
}

TEST_F(calendar_Instant, timestamps)
{
	const Instant t = Instant::from_timestamp(1469475198.0);
	EXPECT_EQ(t, at(2016, 7, 25, 19, 33, 18));
	EXPECT_DOUBLE_EQ(t.timestamp(), 1469475198.0);
	EXPECT_EQ(Instant::from_timestamp(-0.5), at(1969, 12, 31, 23, 59, 59, 500000));
	EXPECT_EQ(Instant::from_timestamp(0.25).microsecond(), 250000u);
	EXPECT_THROW(Instant::from_timestamp(1e300), RangeOverflowError);
}

TEST_F(calendar_Instant, isoformat)
{
	EXPECT_EQ(at(2016, 7, 25, 19, 33, 18).isoformat(), "2016-07-25T19:33:18+00:00");
	EXPECT_EQ(at(2016, 7, 25, 19, 33, 18, 1200).isoformat(),
			  "2016-07-25T19:33:18.001200+00:00");
	std::ostringstream os;
	os << at(1, 1, 1);
	EXPECT_EQ(os.str(), "0001-01-01T00:00:00+00:00");
}

TEST_F(calendar_Instant, shift_clamps_day)
{
	EXPECT_EQ(at(2016, 1, 31).shift({.months = 1}), at(2016, 2, 29));
	EXPECT_EQ(at(2016, 2, 29).shift({.years = 1}), at(2017, 2, 28));
	EXPECT_EQ(at(2016, 3, 31).shift({.months = -1}), at(2016, 2, 29));
	EXPECT_EQ(at(2016, 12, 31).shift({.months = 2}), at(2017, 2, 28));
}

TEST_F(calendar_Instant, shift_exact_units)
{
	const Instant t = at(2016, 7, 25, 19, 33, 18);
	EXPECT_EQ(t.shift({.weeks = 1, .days = 1, .hours = 4, .minutes = 26, .seconds = 42}),
			  at(2016, 8, 3));
	EXPECT_EQ(t.shift({.microseconds = -1}), at(2016, 7, 25, 19, 33, 17, 999999));
	EXPECT_THROW(Instant::max().shift({.microseconds = 1}), RangeOverflowError);
	EXPECT_THROW(t.shift({.years = 8000}), RangeOverflowError);
}

TEST_F(calendar_Instant, arithmetic)
{
	const Instant a = at(2016, 7, 25, 19, 33, 18);
	const Instant b = at(2016, 7, 25, 17, 1, 18);
	EXPECT_EQ((a - b).total_microseconds(), 9120LL * 1'000'000);
	EXPECT_EQ(b + (a - b), a);
	EXPECT_EQ(a - (a - b), b);
	EXPECT_TRUE(b.is_before(a));
	EXPECT_TRUE(a.is_after(b));
	EXPECT_TRUE(a.is_on_or_after(a));
	EXPECT_TRUE(a.is_between(b, a));
	EXPECT_FALSE(b.is_between(a, a));
}

TEST_F(calendar_Instant, replace)
{
	const Instant t = at(2016, 7, 25, 19, 33, 18);
	EXPECT_EQ(t.with_year(2015), at(2015, 7, 25, 19, 33, 18));
	EXPECT_EQ(t.with_hour(0).with_minute(0).with_second(0), at(2016, 7, 25));
	EXPECT_THROW(at(2016, 2, 29).with_year(2015), InvalidValueError);
}
