// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "UtcTimeKit/calendar/Timezone.hpp"

#include <boost/regex.hpp>

#include <cstdlib>

#include "UtcTimeKit/calendar/Config.hpp"
#include "UtcTimeKit/calendar/Log.hpp"
#include "low_level/civil.hpp"
#include "low_level/digits.hpp"
#include "low_level/text.hpp"
#include "low_level/tzif.hpp"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;
using namespace UtcTimeKit::calendar::source::low_level;

static constexpr const char *s_local = "local";
static constexpr const char *s_system_localtime = "/etc/localtime";

bool UtcTimeKit::calendar::is_utc_name(const std::string &zone) {
	const std::string lower = to_lower_ascii(zone);
	return lower == "utc" || lower == "z" || lower == "gmt" || lower == "zulu" ||
		   lower == "etc/utc" || lower == "etc/gmt";
}

std::optional<int32_t> UtcTimeKit::calendar::parse_fixed_offset(const std::string &zone) {
	static const boost::regex pattern{R"(^(?:UTC|GMT)?([+-])(\d{1,2})(?::?(\d{2}))?$)",
									  boost::regex::icase};
	boost::smatch match;
	if (!boost::regex_match(zone, match, pattern)) return std::nullopt;
	const int32_t hours = std::stoi(match[2].str());
	const int32_t minutes = match[3].matched ? std::stoi(match[3].str()) : 0;
	if (hours > 23 || minutes > 59) return std::nullopt;
	const int32_t seconds = hours * 3600 + minutes * 60;
	return match[1].str() == "-" ? -seconds : seconds;
}

// ============================================================================
// TimezoneProvider
// ============================================================================

Instant TimezoneProvider::to_utc(const std::string &zone, const Instant &wall_time) const {
	const int64_t wall = wall_time.microseconds_since_epoch();
	const int64_t first = offset_at(zone, wall_time).seconds * US_PER_SECOND;
	const Instant guess = Instant::from_microseconds(wall - first);
	const int64_t second = offset_at(zone, guess).seconds * US_PER_SECOND;
	return Instant::from_microseconds(wall - second);
}

Instant TimezoneProvider::to_wall_time(const std::string &zone, const Instant &instant) const {
	const int64_t offset = offset_at(zone, instant).seconds * US_PER_SECOND;
	return Instant::from_microseconds(instant.microseconds_since_epoch() + offset);
}

// ============================================================================
// ZoneinfoProvider
// ============================================================================

namespace {
	// IANA style names only, nothing that climbs out of the zoneinfo directory
	bool is_zone_name(const std::string &zone) {
		if (zone.empty() || zone.front() == '/' || zone.find("..") != std::string::npos)
			return false;
		return zone.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"
									  "0123456789/_-+") == std::string::npos;
	}

	// the zone "local" stands for: TZ (leading ':' dropped), else /etc/localtime, else UTC
	std::string resolve_local(void) {
		const char *const env = std::getenv("TZ");
		if (env != nullptr && env[0] != '\0') {
			std::string tz{env};
			if (tz.front() == ':') tz.erase(0, 1);
			if (!tz.empty()) return tz;
		}
		if (TzifReader::isTzifFile(s_system_localtime)) return s_system_localtime;
		return "UTC";
	}
} // namespace

ZoneinfoProvider::ZoneinfoProvider(std::filesystem::path directory)
	: m_directory(std::move(directory)) {}

ZoneinfoProvider::~ZoneinfoProvider() = default;

ZoneinfoProvider::TablePtr ZoneinfoProvider::load(const std::string &zone) const {
	std::filesystem::path file{};
	if (zone.front() == '/') {
		file = zone;
	} else if (is_zone_name(zone)) {
		file = (m_directory.empty() ? config::get_zoneinfo_path() : m_directory) / zone;
	} else {
		return nullptr;
	}
	std::error_code ec{};
	if (!std::filesystem::is_regular_file(file, ec) || !TzifReader::isTzifFile(file)) {
		log_verbose("no zoneinfo file for \"", zone, "\" at ", file.string());
		return nullptr;
	}
	log_verbose("loading zone ", zone, " from ", file.string());
	return std::make_shared<const TzifData>(TzifReader::read(file, zone));
}

ZoneinfoProvider::TablePtr ZoneinfoProvider::table(const std::string &zone) const {
	if (zone.empty()) return nullptr;
	const std::lock_guard lock{m_lock};
	const auto cached = m_cache.find(zone);
	if (cached != m_cache.end()) return cached->second;
	auto loaded = load(zone);
	// misses stay out so arbitrary names cannot grow the cache
	if (loaded) m_cache.emplace(zone, loaded);
	return loaded;
}

UtcOffset ZoneinfoProvider::offset_at(const std::string &zone, const Instant &instant) const {
	if (zone == s_local) {
		const std::string effective = resolve_local();
		if (effective != s_local && is_known(effective)) return offset_at(effective, instant);
		log_verbose("TZ=\"", effective, "\" is unknown, local time is UTC");
		return UtcOffset{};
	}
	if (is_utc_name(zone)) return UtcOffset{};
	if (const auto fixed = parse_fixed_offset(zone))
		return UtcOffset{*fixed, false, format_offset(*fixed, true)};

	const TablePtr data = table(zone);
	if (!data) UTK_THROW(InvalidValueError, "unknown time zone \"" + zone + "\"");
	const TzifType &type =
		data->type_at(floor_div(instant.microseconds_since_epoch(), US_PER_SECOND));
	return UtcOffset{type.utoff, type.dst, type.abbreviation};
}

bool ZoneinfoProvider::is_known(const std::string &zone) const {
	if (zone == s_local || is_utc_name(zone) || parse_fixed_offset(zone)) return true;
	return table(zone) != nullptr;
}

const TimezoneProvider &UtcTimeKit::calendar::default_timezone_provider(void) {
	static const ZoneinfoProvider provider{};
	return provider;
}
