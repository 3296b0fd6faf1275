// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef UTK_CALENDAR_LOCALE_HEADER
#define UTK_CALENDAR_LOCALE_HEADER

#include <array>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "Common.hpp"

namespace UtcTimeKit::calendar {

	enum class Style { long_form, short_form, narrow };
	EXPORT Style style_from_string(const std::string &name);

	enum class PluralCategory { zero, one, two, few, many, other };
	enum class PluralRule { one_other, zero_one_other, east_slavic, other };

	EXPORT PluralCategory plural_category(PluralRule rule, int64_t count) noexcept;

	/**
	 * @brief Read-only name and phrase tables of one locale
	 *
	 * Weekday tables start on Monday. Phrase templates contain "{0}" where the count goes.
	 */
	struct EXPORT LocaleData {
		struct Phrases {
			std::map<PluralCategory, std::string> plain;
			std::map<PluralCategory, std::string> future;
			std::map<PluralCategory, std::string> past;
		};

		std::string id;
		PluralRule plural_rule{PluralRule::one_other};
		std::array<std::string, 12> months_wide;
		std::array<std::string, 12> months_abbreviated;
		std::array<std::string, 7> weekdays_wide;
		std::array<std::string, 7> weekdays_abbreviated;
		std::array<std::string, 2> day_periods; // AM, PM
		// style -> unit name ("year" ... "second") -> phrases
		std::array<std::map<std::string, Phrases>, 3> units;

		[[nodiscard]] const std::string &month_name(uint32_t month, bool abbreviated) const;
		[[nodiscard]] const std::string &weekday_name(uint32_t isoweekday, bool abbreviated) const;
		[[nodiscard]] const std::string &day_period(bool pm) const noexcept {
			return day_periods[pm ? 1 : 0];
		}

		// case-insensitive reverse lookups for parsing
		[[nodiscard]] std::optional<uint32_t> month_from_name(const std::string &name) const;
		[[nodiscard]] std::optional<uint32_t> weekday_from_name(const std::string &name) const;
		[[nodiscard]] std::optional<bool> is_pm_marker(const std::string &marker) const;

		// "3 hours"
		[[nodiscard]] std::string format_unit(Style style, const std::string &unit,
											  int64_t count) const;
		// "in 3 hours" or "3 hours ago"
		[[nodiscard]] std::string format_relative(Style style, const std::string &unit,
												  int64_t count, bool future) const;

	  private:
		const Phrases &phrases(Style style, const std::string &unit) const;
	};

	class EXPORT LocaleProvider {
	  public:
		virtual ~LocaleProvider() = default;
		/**
		 * @brief Name tables for a locale identifier such as "en", "de_DE" or "de-AT"
		 * @throws InvalidValueError for an unknown locale
		 */
		virtual std::shared_ptr<const LocaleData> resolve(const std::string &locale) const = 0;
	};

	/**
	 * @brief Loads <directory>/<locale>.json documents and caches them
	 *
	 * "de_DE" falls back to "de"; "C", "POSIX" and "en_US_POSIX" map to "en". With an empty
	 * directory the configured locale path is used on every lookup.
	 */
	class EXPORT JsonLocaleProvider final : public LocaleProvider {
	  public:
		explicit JsonLocaleProvider(std::filesystem::path directory = {});
		std::shared_ptr<const LocaleData> resolve(const std::string &locale) const override;

		// @throws DataError for malformed content
		static LocaleData parse_document(const std::string &json, const std::string &id);

	  private:
		std::shared_ptr<const LocaleData> load(const std::string &locale) const;

		const std::filesystem::path m_directory;
		mutable std::mutex m_lock{};
		mutable std::map<std::string, std::shared_ptr<const LocaleData>> m_cache{};
	};

	EXPORT const LocaleProvider &default_locale_provider(void);

	/**
	 * @brief Name tables of locale, or of the configured default when locale is empty
	 *
	 * A configured default without name tables (LANG=fr_FR.UTF-8 and no fr.json) falls back
	 * to "en". A locale named by the caller is never substituted.
	 * @throws InvalidValueError for an unknown locale named by the caller
	 */
	EXPORT std::shared_ptr<const LocaleData> resolve_locale(const LocaleProvider &locales,
															const std::string &locale);

} // namespace UtcTimeKit::calendar

#endif
