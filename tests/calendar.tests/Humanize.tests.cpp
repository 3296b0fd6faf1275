// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include <string>
#include <string_view>

#include "UtcTimeKit/calendar/Humanize.hpp"
#include "helper.hpp"
#include "gtest/gtest.h"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;

namespace
{
struct Data {
	double seconds;
	double threshold;
	std::string_view expected;
	std::string_view file;
	size_t line;
};
#define DATA(...)                       \
	Data                                \
	{                                   \
		__VA_ARGS__, __FILE__, __LINE__ \
	}

inline std::ostream &operator<<(std::ostream &os, Data const &p)
{
	os << p.file << ":" << p.line;
	return os;
}
} // namespace

class calendar_Humanize : public ::testing::TestWithParam<Data>
{
  protected:
	static HumanizeConfig english()
	{
		HumanizeConfig config{};
		config.locale = "en";
		return config;
	}
	static std::string humanized(double seconds, const HumanizeConfig &config)
	{
		return humanize(Duration::from_seconds(seconds), config, test_locales());
	}
};

TEST_P(calendar_Humanize, test_execution)
{
	const auto &param = GetParam();
	HumanizeConfig config = english();
	config.threshold = param.threshold;
	EXPECT_EQ(humanized(param.seconds, config), param.expected) << param.file << ":" << param.line;
}

INSTANTIATE_TEST_SUITE_P(
	calendar_Humanize_tests, calendar_Humanize, // clang-format off
::testing::Values(
DATA(9120, 0, "0 years"),
DATA(9120, 0.1, "0 days"),
DATA(9120, 0.2, "3 hours"),
DATA(9120, 5, "152 minutes"),
DATA(9120, 155, "9120 seconds"),
DATA(9120, 0.85, "3 hours"),
DATA(9000, 0.85, "2 hours"),
DATA(12600, 0.85, "4 hours"),
DATA(3600, 0.85, "1 hour"),
DATA(0, 0.85, "0 seconds"),
DATA(1, 0.85, "1 second"),
DATA(-9120, 0.85, "3 hours"),
DATA(40 * 86400, 0.85, "1 month"),
DATA(400 * 86400, 0.85, "1 year"),
DATA(10 * 86400, 0.85, "1 week"),
DATA(9120.9, 1e9, "9120 seconds")
));
												// clang-format on

TEST_F(calendar_Humanize, direction)
{
	HumanizeConfig config = english();
	config.add_direction = true;
	EXPECT_EQ(humanized(9120, config), "in 3 hours");
	EXPECT_EQ(humanized(-9120, config), "3 hours ago");
	EXPECT_EQ(humanized(0, config), "in 0 seconds");
	EXPECT_EQ(humanized(-3600, config), "1 hour ago");
}

TEST_F(calendar_Humanize, granularity)
{
	HumanizeConfig config = english();
	config.granularity = SpanUnit::day;
	EXPECT_EQ(humanized(7200, config), "1 day");
	EXPECT_EQ(humanized(0, config), "0 days");
	config.granularity = SpanUnit::hour;
	EXPECT_EQ(humanized(5400, config), "2 hours");
	EXPECT_EQ(humanized(60, config), "1 hour");
	config.granularity = SpanUnit::decade;
	EXPECT_THROW(humanized(60, config), InvalidUnitError);
	config.granularity = SpanUnit::century;
	EXPECT_THROW(humanized(60, config), InvalidUnitError);
}

TEST_F(calendar_Humanize, styles)
{
	HumanizeConfig config = english();
	config.style = Style::short_form;
	EXPECT_EQ(humanized(9120, config), "3 hr");
	config.style = style_from_string("narrow");
	EXPECT_EQ(humanized(9120, config), "3h");
	config.add_direction = true;
	EXPECT_EQ(humanized(-9120, config), "3h ago");
}

TEST_F(calendar_Humanize, german)
{
	HumanizeConfig config{};
	config.locale = "de_DE";
	EXPECT_EQ(humanized(9120, config), "3 Stunden");
	EXPECT_EQ(humanized(3600, config), "1 Stunde");
	config.add_direction = true;
	EXPECT_EQ(humanized(-3 * 86400, config), "vor 3 Tagen");
	EXPECT_EQ(humanized(86400, config), "in 1 Tag");
}

TEST_F(calendar_Humanize, unknown_locale)
{
	HumanizeConfig config{};
	config.locale = "xx";
	EXPECT_THROW(humanized(1, config), InvalidValueError);
}

TEST_F(calendar_Humanize, between_instants)
{
	const Instant later = at(2016, 7, 25, 19, 33);
	const Instant earlier = at(2016, 7, 25, 17, 1);
	HumanizeConfig config = english();
	config.add_direction = true;
	EXPECT_EQ(time_from(later, earlier, config, test_locales()), "in 3 hours");
	EXPECT_EQ(time_from(earlier, later, config, test_locales()), "3 hours ago");
	EXPECT_EQ(time_to(later, earlier, config, test_locales()), "3 hours ago");
	config.add_direction = false;
	EXPECT_EQ(time_to(later, earlier, config, test_locales()), "3 hours");
}

TEST_F(calendar_Humanize, relative_to_now)
{
	const Duration three_hours = Duration::from_seconds(3 * 3600 + 60);
	HumanizeConfig config = english();
	config.add_direction = true;
	EXPECT_EQ(time_from_now(Instant::now() + three_hours, config, test_locales()), "in 3 hours");
	EXPECT_EQ(time_from_now(Instant::now() - three_hours, config, test_locales()), "3 hours ago");
	EXPECT_EQ(time_to_now(Instant::now() - three_hours, config, test_locales()), "in 3 hours");
	config.add_direction = false;
	EXPECT_EQ(time_to_now(Instant::now() + three_hours, config, test_locales()), "3 hours");
}
