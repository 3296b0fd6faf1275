// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef UTK_CALENDAR_TIMEZONE_HEADER
#define UTK_CALENDAR_TIMEZONE_HEADER

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "Common.hpp"
#include "Instant.hpp"

namespace UtcTimeKit::calendar {

	namespace source::low_level {
		struct TzifData;
	} // namespace source::low_level

	struct UtcOffset {
		int32_t seconds = 0; // east of UTC
		bool dst = false;
		std::string abbreviation = "UTC";
	};

	/**
	 * @brief Source of UTC offsets for zone identifiers
	 *
	 * Zone identifiers are "UTC", fixed offsets such as "+05:30", "local" for the system zone, or
	 * whatever names an implementation knows (IANA names for the zoneinfo provider).
	 */
	class EXPORT TimezoneProvider {
	  public:
		virtual ~TimezoneProvider() = default;
		// @throws InvalidValueError for an unknown zone
		virtual UtcOffset offset_at(const std::string &zone, const Instant &instant) const = 0;
		virtual bool is_known(const std::string &zone) const = 0;

		/**
		 * @brief Interpret wall clock fields of a zone and return the matching UTC instant
		 *
		 * The offset is looked up twice, first at the wall time read as UTC and then at the
		 * resulting guess. Wall times in a gap or overlap resolve to one of the neighbours.
		 */
		Instant to_utc(const std::string &zone, const Instant &wall_time) const;
		// wall clock fields of the zone at the instant, still stored as an Instant
		Instant to_wall_time(const std::string &zone, const Instant &instant) const;
	};

	// "+05:30", "-0800", "+05", "UTC+2", "GMT-03:30"; seconds east of UTC
	EXPORT std::optional<int32_t> parse_fixed_offset(const std::string &zone);
	EXPORT bool is_utc_name(const std::string &zone);

	/**
	 * @brief Reads compiled TZif files below a zoneinfo directory
	 *
	 * Offsets come from the transition table only. Past the last transition of a file its
	 * final type applies, the POSIX rule in the footer of version 2+ files is not evaluated.
	 * With an empty directory the configured zoneinfo path is used. "local" follows the TZ
	 * environment variable and falls back to /etc/localtime, then to UTC.
	 */
	class EXPORT ZoneinfoProvider final : public TimezoneProvider {
	  public:
		explicit ZoneinfoProvider(std::filesystem::path directory = {});
		~ZoneinfoProvider() override;

		UtcOffset offset_at(const std::string &zone, const Instant &instant) const override;
		bool is_known(const std::string &zone) const override;

	  private:
		using TablePtr = std::shared_ptr<const source::low_level::TzifData>;
		// nullptr when no such zone exists, only found zones are cached
		TablePtr table(const std::string &zone) const;
		TablePtr load(const std::string &zone) const;

		const std::filesystem::path m_directory;
		mutable std::mutex m_lock{};
		mutable std::map<std::string, TablePtr> m_cache{};
	};

	EXPORT const TimezoneProvider &default_timezone_provider(void);

} // namespace UtcTimeKit::calendar

#endif
