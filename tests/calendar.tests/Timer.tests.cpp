// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "UtcTimeKit/calendar/Timer.hpp"
#include "helper.hpp"
#include "gtest/gtest.h"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;

class calendar_Timer : public ::testing::Test
{
  protected:
	Instant m_now = at(2016, 7, 25, 19, 33);

	Timer::Clock clock()
	{
		return [this] { return m_now; };
	}
	void advance(double seconds) { m_now = m_now + Duration::from_seconds(seconds); }
};

TEST_F(calendar_Timer, never_started)
{
	const Timer timer{Duration::from_seconds(5), clock()};
	EXPECT_FALSE(timer.started());
	EXPECT_TRUE(timer.stopped());
	EXPECT_EQ(timer.elapsed(), Duration{});
	EXPECT_EQ(timer.remaining(), Duration::from_seconds(5));
	EXPECT_FALSE(timer.done());
	EXPECT_TRUE(Timer{}.done());
}

TEST_F(calendar_Timer, runs_until_stopped)
{
	Timer timer{Duration::from_seconds(5), clock()};
	timer.start();
	EXPECT_TRUE(timer.started());
	EXPECT_FALSE(timer.stopped());
	advance(2);
	EXPECT_EQ(timer.elapsed(), Duration::from_seconds(2));
	EXPECT_EQ(timer.remaining(), Duration::from_seconds(3));
	EXPECT_FALSE(timer.done());

	timer.stop();
	advance(10);
	EXPECT_FALSE(timer.started());
	EXPECT_TRUE(timer.stopped());
	EXPECT_EQ(timer.elapsed(), Duration::from_seconds(2));
	EXPECT_FALSE(timer.done());
}

TEST_F(calendar_Timer, restart_resumes)
{
	Timer timer{Duration::from_seconds(5), clock()};
	timer.start();
	advance(2);
	timer.stop();
	advance(60);
	timer.start();
	advance(4);
	EXPECT_EQ(timer.elapsed(), Duration::from_seconds(6));
	EXPECT_EQ(timer.remaining(), Duration::from_seconds(-1));
	EXPECT_TRUE(timer.done());

	timer.reset();
	EXPECT_FALSE(timer.started());
	EXPECT_EQ(timer.elapsed(), Duration{});
	timer.start();
	advance(1);
	EXPECT_EQ(timer.elapsed(), Duration::from_seconds(1));
}

TEST_F(calendar_Timer, scope)
{
	Timer timer{Duration::from_seconds(1), clock()};
	{
		const TimerScope scope{timer};
		EXPECT_TRUE(timer.started());
		advance(1.5);
	}
	advance(3);
	EXPECT_TRUE(timer.stopped());
	EXPECT_EQ(timer.elapsed(), Duration::from_seconds(1.5));
	EXPECT_TRUE(timer.done());
}

TEST_F(calendar_Timer, system_clock)
{
	Timer timer{};
	timer.start().stop();
	EXPECT_GE(timer.elapsed(), Duration{});
	EXPECT_EQ(timer.timeout(), Duration{});
	EXPECT_THROW(Timer(Duration{}, Timer::Clock{}), InvalidValueError);
}
