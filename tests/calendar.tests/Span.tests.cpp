// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include <cstdint>
#include <string>
#include <vector>

#include "UtcTimeKit/calendar/Span.hpp"
#include "helper.hpp"
#include "gtest/gtest.h"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;

class calendar_Span : public ::testing::Test
{
  protected:
	const Instant t = at(2015, 4, 4, 12, 30, 37, 651839);
};

// ============================================================================
// boundaries
// ============================================================================

TEST_F(calendar_Span, start_of)
{
	EXPECT_EQ(start_of(SpanUnit::century, t), at(2000, 1, 1));
	EXPECT_EQ(start_of(SpanUnit::decade, t), at(2010, 1, 1));
	EXPECT_EQ(start_of(SpanUnit::year, t), at(2015, 1, 1));
	EXPECT_EQ(start_of(SpanUnit::month, t), at(2015, 4, 1));
	EXPECT_EQ(start_of(SpanUnit::week, t), at(2015, 3, 30)); // Monday
	EXPECT_EQ(start_of(SpanUnit::day, t), at(2015, 4, 4));
	EXPECT_EQ(start_of(SpanUnit::hour, t), at(2015, 4, 4, 12));
	EXPECT_EQ(start_of(SpanUnit::minute, t), at(2015, 4, 4, 12, 30));
	EXPECT_EQ(start_of(SpanUnit::second, t), at(2015, 4, 4, 12, 30, 37));
	EXPECT_EQ(start_of(SpanUnit::week, at(2015, 3, 30)), at(2015, 3, 30));
	EXPECT_EQ(start_of(SpanUnit::week, at(1, 1, 3)), at(1, 1, 1));
	EXPECT_THROW(start_of(SpanUnit::century, at(99, 6, 1)), RangeOverflowError);
}

TEST_F(calendar_Span, end_of)
{
	EXPECT_EQ(end_of(SpanUnit::century, t), at(2099, 12, 31, 23, 59, 59, 999999));
	EXPECT_EQ(end_of(SpanUnit::decade, t), at(2019, 12, 31, 23, 59, 59, 999999));
	EXPECT_EQ(end_of(SpanUnit::month, at(2016, 2, 10)), at(2016, 2, 29, 23, 59, 59, 999999));
	EXPECT_EQ(end_of(SpanUnit::week, t), at(2015, 4, 5, 23, 59, 59, 999999));
	EXPECT_EQ(end_of(SpanUnit::second, t), at(2015, 4, 4, 12, 30, 37, 999999));
	EXPECT_EQ(end_of(SpanUnit::month, t, 3), at(2015, 6, 30, 23, 59, 59, 999999));
	EXPECT_EQ(end_of(SpanUnit::decade, t, 2), at(2029, 12, 31, 23, 59, 59, 999999));
	EXPECT_EQ(end_of(SpanUnit::year, at(9999, 6, 1)), Instant::max());
	EXPECT_THROW(end_of(SpanUnit::year, at(9999, 6, 1), 2), RangeOverflowError);
	EXPECT_THROW(end_of(SpanUnit::day, t, 0), InvalidValueError);
}

TEST_F(calendar_Span, span)
{
	const SpanBoundary decade = span(SpanUnit::decade, t);
	EXPECT_EQ(decade.start, at(2010, 1, 1));
	EXPECT_EQ(decade.end, at(2019, 12, 31, 23, 59, 59, 999999));
	for (const SpanUnit unit : {SpanUnit::second, SpanUnit::minute, SpanUnit::hour, SpanUnit::day,
								SpanUnit::week, SpanUnit::month, SpanUnit::year, SpanUnit::decade,
								SpanUnit::century}) {
		const SpanBoundary s = span(unit, t);
		EXPECT_LE(s.start, t) << to_string(unit);
		EXPECT_GE(s.end, t) << to_string(unit);
		EXPECT_EQ(s.end.microsecond(), 999999u) << to_string(unit);
		EXPECT_EQ(start_of(unit, s.end + Duration::resolution()), s.end + Duration::resolution())
			<< to_string(unit);
	}
}

TEST_F(calendar_Span, unit_names)
{
	EXPECT_EQ(span_unit_from_string("decade"), SpanUnit::decade);
	EXPECT_EQ(span_unit_from_string("Week"), SpanUnit::week);
	EXPECT_EQ(to_string(SpanUnit::century), "century");
	EXPECT_THROW(span_unit_from_string("fortnight"), InvalidUnitError);
	EXPECT_THROW(span_unit_from_string("days"), InvalidUnitError);
}

TEST_F(calendar_Span, shift_by)
{
	EXPECT_EQ(shift_by(SpanUnit::month, at(2016, 1, 31), 1), at(2016, 2, 29));
	EXPECT_EQ(shift_by(SpanUnit::century, t, -1), at(1915, 4, 4, 12, 30, 37, 651839));
	EXPECT_EQ(shift_by(SpanUnit::week, at(2016, 1, 1), 2), at(2016, 1, 15));
	EXPECT_THROW(shift_by(SpanUnit::year, t, 8000), RangeOverflowError);
}

// ============================================================================
// sequences
// ============================================================================

TEST_F(calendar_Span, range_excludes_end)
{
	const auto hours = range(SpanUnit::hour, at(2015, 4, 4, 12), at(2015, 4, 4, 16)).to_vector();
	ASSERT_EQ(hours.size(), 4u);
	EXPECT_EQ(hours.front(), at(2015, 4, 4, 12));
	EXPECT_EQ(hours.back(), at(2015, 4, 4, 15));

	const auto stepped = range(SpanUnit::hour, at(2015, 4, 4, 12), at(2015, 4, 4, 16, 0, 0, 1), 2)
							 .to_vector();
	EXPECT_EQ(stepped, (std::vector<Instant>{at(2015, 4, 4, 12), at(2015, 4, 4, 14),
											 at(2015, 4, 4, 16)}));

	EXPECT_TRUE(range(SpanUnit::day, t, t).to_vector().empty());
	EXPECT_TRUE(range(SpanUnit::day, t, at(2000, 1, 1)).to_vector().empty());
	EXPECT_THROW(range(SpanUnit::day, t, t, 0), InvalidValueError);
}

TEST_F(calendar_Span, range_steps_from_previous_element)
{
	const auto months = range(SpanUnit::month, at(2016, 1, 31), at(2016, 5, 1)).to_vector();
	EXPECT_EQ(months, (std::vector<Instant>{at(2016, 1, 31), at(2016, 2, 29), at(2016, 3, 29),
											at(2016, 4, 29)}));
	const auto quarters = range(SpanUnit::month, at(2015, 8, 31), at(2016, 6, 1), 3).to_vector();
	EXPECT_EQ(quarters, (std::vector<Instant>{at(2015, 8, 31), at(2015, 11, 30), at(2016, 2, 29),
											  at(2016, 5, 29)}));
}

TEST_F(calendar_Span, huge_counts_overflow)
{
	EXPECT_EQ(end_of(SpanUnit::century, t, 80), Instant::max());
	EXPECT_THROW(end_of(SpanUnit::century, t, 81), RangeOverflowError);
	EXPECT_THROW(end_of(SpanUnit::century, t, 3000), RangeOverflowError);
	EXPECT_THROW(end_of(SpanUnit::century, t, 5826), RangeOverflowError);
	EXPECT_THROW(end_of(SpanUnit::month, t, INT64_MAX), RangeOverflowError);
	EXPECT_THROW(end_of(SpanUnit::week, t, INT64_MAX), RangeOverflowError);
	EXPECT_THROW(shift_by(SpanUnit::year, t, INT64_MAX), RangeOverflowError);

	EXPECT_EQ(range(SpanUnit::century, t, Instant::max(), 5826).to_vector(),
			  (std::vector<Instant>{t}));
	EXPECT_EQ(range(SpanUnit::second, t, Instant::max(), INT64_MAX).to_vector(),
			  (std::vector<Instant>{t}));
	EXPECT_THROW(span_range(SpanUnit::century, t, Instant::max(), 5826).to_vector(),
				 RangeOverflowError);
}

TEST_F(calendar_Span, range_is_restartable)
{
	const InstantRange days = range(SpanUnit::day, at(2015, 4, 1), at(2015, 4, 4));
	size_t first = 0;
	size_t second = 0;
	for (const Instant &day : days) {
		EXPECT_EQ(day.hour(), 0u);
		first++;
	}
	for (auto it = days.begin(); it != days.end(); ++it) second++;
	EXPECT_EQ(first, 3u);
	EXPECT_EQ(second, 3u);
	EXPECT_EQ(days.unit(), SpanUnit::day);
	EXPECT_EQ(days.count(), 1);
}

TEST_F(calendar_Span, span_range)
{
	const auto spans =
		span_range(SpanUnit::day, at(2015, 4, 4, 12), at(2015, 4, 6, 12)).to_vector();
	ASSERT_EQ(spans.size(), 3u);
	EXPECT_EQ(spans[0].start, at(2015, 4, 4));
	EXPECT_EQ(spans[0].end, at(2015, 4, 4, 23, 59, 59, 999999));
	EXPECT_EQ(spans[2].start, at(2015, 4, 6));
	EXPECT_EQ(spans[2].end, at(2015, 4, 6, 23, 59, 59, 999999));
}

TEST_F(calendar_Span, span_range_excludes_span_starting_at_end)
{
	const auto spans = span_range(SpanUnit::year, at(2010, 6, 1), at(2013, 1, 1)).to_vector();
	ASSERT_EQ(spans.size(), 3u);
	EXPECT_EQ(spans.back().start, at(2012, 1, 1));

	const auto grouped = span_range(SpanUnit::month, at(2015, 1, 15), at(2015, 7, 1), 2).to_vector();
	ASSERT_EQ(grouped.size(), 3u);
	EXPECT_EQ(grouped[1].start, at(2015, 3, 1));
	EXPECT_EQ(grouped[1].end, at(2015, 4, 30, 23, 59, 59, 999999));

	EXPECT_TRUE(span_range(SpanUnit::month, at(2015, 1, 15), at(2015, 1, 10)).to_vector().empty());
}

TEST_F(calendar_Span, span_range_up_to_the_last_year)
{
	const auto spans = span_range(SpanUnit::year, at(9998, 3, 1), Instant::max()).to_vector();
	ASSERT_EQ(spans.size(), 2u);
	EXPECT_EQ(spans.back().end, Instant::max());
	const auto sparse = range(SpanUnit::year, at(9998, 3, 1), Instant::max(), 1000).to_vector();
	EXPECT_EQ(sparse.size(), 1u);
}
