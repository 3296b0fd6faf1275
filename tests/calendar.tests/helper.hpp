#pragma once

#include <cstdlib>
#include <filesystem>
#include <map>
#include <memory>
#include <ostream>
#include <string>

#include "UtcTimeKit/calendar/Instant.hpp"
#include "UtcTimeKit/calendar/Locale.hpp"
#include "UtcTimeKit/calendar/Timezone.hpp"
#include "gtest/gtest.h"

#ifndef UTK_LOCALE_DATA_DIR
	#define UTK_LOCALE_DATA_DIR "data/locale"
#endif

[[maybe_unused]]
static std::filesystem::path locale_dir()
{
	const char *const env_path = std::getenv("UTK_LOCALE_PATH");
	if (env_path && *env_path) return env_path;
	return UTK_LOCALE_DATA_DIR;
}

// shared by every test, loads each json document once
[[maybe_unused]]
static const UtcTimeKit::calendar::LocaleProvider &test_locales()
{
	static const UtcTimeKit::calendar::JsonLocaleProvider provider{locale_dir()};
	return provider;
}

// zones with one fixed offset each, for tests that must not depend on the host zoneinfo
class FixedZones final : public UtcTimeKit::calendar::TimezoneProvider
{
  public:
	FixedZones &add(const std::string &zone, int32_t seconds, std::string abbreviation)
	{
		m_zones[zone] = UtcTimeKit::calendar::UtcOffset{seconds, false, std::move(abbreviation)};
		return *this;
	}
	UtcTimeKit::calendar::UtcOffset offset_at(const std::string &zone,
											  const UtcTimeKit::calendar::Instant &) const override
	{
		const auto found = m_zones.find(zone);
		if (found == m_zones.end())
			throw UtcTimeKit::calendar::exception::InvalidValueError("unknown zone " + zone,
																	  __FILE__, __LINE__);
		return found->second;
	}
	bool is_known(const std::string &zone) const override { return m_zones.contains(zone); }

  private:
	std::map<std::string, UtcTimeKit::calendar::UtcOffset> m_zones{};
};

[[maybe_unused]]
static UtcTimeKit::calendar::Instant at(int32_t year, uint32_t month, uint32_t day,
										uint32_t hour = 0, uint32_t minute = 0,
										uint32_t second = 0, uint32_t microsecond = 0)
{
	return UtcTimeKit::calendar::Instant::from_fields(year, month, day, hour, minute, second,
													  microsecond);
}
