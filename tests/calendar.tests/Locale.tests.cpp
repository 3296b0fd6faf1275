// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include <string>

#include "UtcTimeKit/calendar/Locale.hpp"
#include "helper.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;
using ::testing::HasSubstr;

// smallest document the loader accepts; every phrase is "{0} <unit>"
static std::string document(const std::string &plural_rule, const std::string &units = {})
{
	std::string body = units;
	if (body.empty()) {
		std::string style = "{";
		for (const char *const unit : {"year", "month", "week", "day", "hour", "minute", "second"}) {
			if (style.size() > 1) style += ",";
			const std::string u = unit;
			style += "\"" + u + "\":{\"one\":\"{0} " + u + "\",\"few\":\"{0} " + u +
					 "-few\",\"other\":\"{0} " + u + "s\",\"future\":{\"other\":\"+{0} " + u +
					 "\"},\"past\":{\"other\":\"-{0} " + u + "\"}}";
		}
		style += "}";
		body = "{\"long\":" + style + ",\"short\":" + style + ",\"narrow\":" + style + "}";
	}
	return R"({"plural_rule":")" + plural_rule + R"(",)" +
		   R"("months":{"wide":["m1","m2","m3","m4","m5","m6","m7","m8","m9","m10","m11","m12"],)" +
		   R"("abbreviated":["a1","a2","a3","a4","a5","a6","a7","a8","a9","a10","a11","a12"]},)" +
		   R"("weekdays":{"wide":["d1","d2","d3","d4","d5","d6","d7"],)" +
		   R"("abbreviated":["w1","w2","w3","w4","w5","w6","w7"]},)" +
		   R"("day_periods":["vorm.","nachm."],)" + R"("units":)" + body + "}";
}

class calendar_Locale : public ::testing::Test
{
};

TEST_F(calendar_Locale, plural_rules)
{
	EXPECT_EQ(plural_category(PluralRule::one_other, 1), PluralCategory::one);
	EXPECT_EQ(plural_category(PluralRule::one_other, 0), PluralCategory::other);
	EXPECT_EQ(plural_category(PluralRule::one_other, -1), PluralCategory::one);
	EXPECT_EQ(plural_category(PluralRule::zero_one_other, 0), PluralCategory::one);
	EXPECT_EQ(plural_category(PluralRule::zero_one_other, 2), PluralCategory::other);
	EXPECT_EQ(plural_category(PluralRule::east_slavic, 1), PluralCategory::one);
	EXPECT_EQ(plural_category(PluralRule::east_slavic, 21), PluralCategory::one);
	EXPECT_EQ(plural_category(PluralRule::east_slavic, 11), PluralCategory::many);
	EXPECT_EQ(plural_category(PluralRule::east_slavic, 3), PluralCategory::few);
	EXPECT_EQ(plural_category(PluralRule::east_slavic, 13), PluralCategory::many);
	EXPECT_EQ(plural_category(PluralRule::east_slavic, 5), PluralCategory::many);
	EXPECT_EQ(plural_category(PluralRule::other, 1), PluralCategory::other);
}

TEST_F(calendar_Locale, parse_document)
{
	const LocaleData data = JsonLocaleProvider::parse_document(document("east_slavic"), "xx");
	EXPECT_EQ(data.id, "xx");
	EXPECT_EQ(data.plural_rule, PluralRule::east_slavic);
	EXPECT_EQ(data.month_name(12, false), "m12");
	EXPECT_EQ(data.month_name(1, true), "a1");
	EXPECT_EQ(data.weekday_name(7, false), "d7");
	EXPECT_EQ(data.day_period(true), "nachm.");
	EXPECT_EQ(data.month_from_name("A10"), 10u);
	EXPECT_EQ(data.weekday_from_name("w3"), 3u);
	EXPECT_EQ(data.is_pm_marker("VORM."), false);
	EXPECT_FALSE(data.is_pm_marker("noon"));
	EXPECT_THROW((void)data.month_name(13, false), InvalidValueError);

	EXPECT_EQ(data.format_unit(Style::long_form, "hour", 1), "1 hour");
	EXPECT_EQ(data.format_unit(Style::long_form, "hour", 3), "3 hour-few");
	// "many" is missing from the document and falls back to "other"
	EXPECT_EQ(data.format_unit(Style::narrow, "day", 5), "5 days");
	EXPECT_EQ(data.format_relative(Style::short_form, "week", 2, true), "+2 week");
	EXPECT_EQ(data.format_relative(Style::short_form, "week", 2, false), "-2 week");
	EXPECT_THROW((void)data.format_unit(Style::long_form, "decade", 1), DataError);
}

TEST_F(calendar_Locale, malformed_documents)
{
	EXPECT_THROW(JsonLocaleProvider::parse_document("{", "xx"), DataError);
	EXPECT_THROW(JsonLocaleProvider::parse_document("[]", "xx"), DataError);
	EXPECT_THROW(JsonLocaleProvider::parse_document(document("dual"), "xx"), DataError);
	EXPECT_THROW(JsonLocaleProvider::parse_document(document("one_other", "{}"), "xx"), DataError);
	std::string short_months = document("one_other");
	short_months.replace(short_months.find(",\"m12\""), 6, "");
	try {
		JsonLocaleProvider::parse_document(short_months, "xx");
		FAIL() << "should throw";
	} catch (const DataError &e) {
		EXPECT_THAT(e.reason(), HasSubstr("months.wide"));
	}
}

TEST_F(calendar_Locale, shipped_locales)
{
	const auto en = test_locales().resolve("en");
	EXPECT_EQ(en->month_name(7, false), "July");
	EXPECT_EQ(en->weekday_name(1, true), "Mon");
	EXPECT_EQ(en->format_relative(Style::long_form, "hour", 1, false), "1 hour ago");
	const auto de = test_locales().resolve("de");
	EXPECT_EQ(de->month_name(3, false), "März");
	EXPECT_EQ(de->format_relative(Style::long_form, "day", 2, false), "vor 2 Tagen");
	EXPECT_EQ(de->format_unit(Style::long_form, "day", 1), "1 Tag");
}

TEST_F(calendar_Locale, identifier_fallbacks)
{
	EXPECT_EQ(test_locales().resolve("de_DE")->id, "de");
	EXPECT_EQ(test_locales().resolve("de-AT")->id, "de");
	EXPECT_EQ(test_locales().resolve("C")->id, "en");
	EXPECT_EQ(test_locales().resolve("POSIX")->id, "en");
	EXPECT_EQ(test_locales().resolve("en_US_POSIX")->id, "en");
	EXPECT_EQ(test_locales().resolve("en"), test_locales().resolve("en"));
	EXPECT_THROW(test_locales().resolve("xx"), InvalidValueError);
	EXPECT_THROW(test_locales().resolve("../en"), InvalidValueError);
	EXPECT_THROW(test_locales().resolve(""), InvalidValueError);
}

TEST_F(calendar_Locale, styles)
{
	EXPECT_EQ(style_from_string("long"), Style::long_form);
	EXPECT_EQ(style_from_string("Short"), Style::short_form);
	EXPECT_EQ(style_from_string("narrow"), Style::narrow);
	EXPECT_THROW(style_from_string("tiny"), InvalidValueError);
}
