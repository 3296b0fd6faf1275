// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "UtcTimeKit/calendar/Locale.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

#include "UtcTimeKit/calendar/Config.hpp"
#include "UtcTimeKit/calendar/Log.hpp"
#include "low_level/text.hpp"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;
using namespace UtcTimeKit::calendar::source::low_level;
namespace rj = rapidjson;

static constexpr const char *s_style_names[3] = {"long", "short", "narrow"};
static constexpr const char *s_unit_names[7] = {"year", "month", "week",  "day",
												"hour", "minute", "second"};

Style UtcTimeKit::calendar::style_from_string(const std::string &name) {
	const std::string lower = to_lower_ascii(name);
	for (size_t i = 0; i < 3; i++)
		if (lower == s_style_names[i]) return static_cast<Style>(i);
	UTK_THROW(InvalidValueError, "unknown style \"" + name + "\"");
}

PluralCategory UtcTimeKit::calendar::plural_category(PluralRule rule, int64_t count) noexcept {
	const uint64_t n = count < 0 ? static_cast<uint64_t>(-(count + 1)) + 1 : count;
	switch (rule) {
	case PluralRule::one_other: return n == 1 ? PluralCategory::one : PluralCategory::other;
	case PluralRule::zero_one_other:
		return n <= 1 ? PluralCategory::one : PluralCategory::other;
	case PluralRule::east_slavic: {
		const uint64_t mod10 = n % 10;
		const uint64_t mod100 = n % 100;
		if (mod10 == 1 && mod100 != 11) return PluralCategory::one;
		if (mod10 >= 2 && mod10 <= 4 && (mod100 < 12 || mod100 > 14)) return PluralCategory::few;
		return PluralCategory::many;
	}
	case PluralRule::other: return PluralCategory::other;
	}
	return PluralCategory::other;
}

// ============================================================================
// LocaleData
// ============================================================================

const std::string &LocaleData::month_name(uint32_t month, bool abbreviated) const {
	if (month < 1 || month > 12) UTK_THROW(InvalidValueError, "month must be in 1..12");
	return abbreviated ? months_abbreviated[month - 1] : months_wide[month - 1];
}

const std::string &LocaleData::weekday_name(uint32_t isoweekday, bool abbreviated) const {
	if (isoweekday < 1 || isoweekday > 7) UTK_THROW(InvalidValueError, "weekday must be in 1..7");
	return abbreviated ? weekdays_abbreviated[isoweekday - 1] : weekdays_wide[isoweekday - 1];
}

std::optional<uint32_t> LocaleData::month_from_name(const std::string &name) const {
	for (uint32_t i = 0; i < 12; i++) {
		if (iequals(name, months_wide[i]) || iequals(name, months_abbreviated[i])) return i + 1;
	}
	return std::nullopt;
}

std::optional<uint32_t> LocaleData::weekday_from_name(const std::string &name) const {
	for (uint32_t i = 0; i < 7; i++) {
		if (iequals(name, weekdays_wide[i]) || iequals(name, weekdays_abbreviated[i]))
			return i + 1;
	}
	return std::nullopt;
}

std::optional<bool> LocaleData::is_pm_marker(const std::string &marker) const {
	if (iequals(marker, day_periods[0])) return false;
	if (iequals(marker, day_periods[1])) return true;
	return std::nullopt;
}

const LocaleData::Phrases &LocaleData::phrases(Style style, const std::string &unit) const {
	const auto &table = units[static_cast<size_t>(style)];
	const auto found = table.find(unit);
	if (found == table.end())
		UTK_THROW(DataError, "locale \"" + id + "\" has no phrases for unit \"" + unit + "\"");
	return found->second;
}

static const std::string &pick(const std::map<PluralCategory, std::string> &forms,
							   PluralCategory category) {
	const auto found = forms.find(category);
	if (found != forms.end()) return found->second;
	return forms.at(PluralCategory::other); // presence checked while loading
}

std::string LocaleData::format_unit(Style style, const std::string &unit, int64_t count) const {
	const auto category = plural_category(plural_rule, count);
	return substitute(pick(phrases(style, unit).plain, category), std::to_string(count));
}

std::string LocaleData::format_relative(Style style, const std::string &unit, int64_t count,
										bool future) const {
	const auto category = plural_category(plural_rule, count);
	const Phrases &p = phrases(style, unit);
	return substitute(pick(future ? p.future : p.past, category), std::to_string(count));
}

// ============================================================================
// JSON documents
// ============================================================================

static const rj::Value &member(const rj::Value &object, const char *name, const std::string &id) {
	if (!object.IsObject()) UTK_THROW(DataError, "locale \"" + id + "\": expected an object");
	const auto found = object.FindMember(name);
	if (found == object.MemberEnd())
		UTK_THROW(DataError, "locale \"" + id + "\": missing \"" + name + "\"");
	return found->value;
}

template <size_t N>
static std::array<std::string, N> string_array(const rj::Value &value, const char *what,
											   const std::string &id) {
	if (!value.IsArray() || value.Size() != N)
		UTK_THROW(DataError, "locale \"" + id + "\": \"" + what + "\" needs " + std::to_string(N) +
								 " strings");
	std::array<std::string, N> out{};
	for (rj::SizeType i = 0; i < N; i++) {
		if (!value[i].IsString())
			UTK_THROW(DataError, "locale \"" + id + "\": \"" + what + "\" needs strings");
		out[i] = value[i].GetString();
	}
	return out;
}

static std::optional<PluralCategory> category_from_key(const std::string &key) {
	static const std::pair<const char *, PluralCategory> keys[] = {
		{"zero", PluralCategory::zero}, {"one", PluralCategory::one},
		{"two", PluralCategory::two},	{"few", PluralCategory::few},
		{"many", PluralCategory::many}, {"other", PluralCategory::other},
	};
	for (const auto &[name, category] : keys)
		if (key == name) return category;
	return std::nullopt;
}

static std::map<PluralCategory, std::string> plural_forms(const rj::Value &value,
														  const std::string &where,
														  const std::string &id) {
	std::map<PluralCategory, std::string> out{};
	for (auto it = value.MemberBegin(); it != value.MemberEnd(); ++it) {
		const auto category = category_from_key(it->name.GetString());
		if (!category) continue; // "future" and "past" share the object
		if (!it->value.IsString())
			UTK_THROW(DataError, "locale \"" + id + "\": " + where + " forms must be strings");
		out.emplace(*category, it->value.GetString());
	}
	if (!out.contains(PluralCategory::other))
		UTK_THROW(DataError, "locale \"" + id + "\": " + where + " lacks the \"other\" form");
	return out;
}

static PluralRule plural_rule_from_string(const std::string &name, const std::string &id) {
	if (name == "one_other") return PluralRule::one_other;
	if (name == "zero_one_other") return PluralRule::zero_one_other;
	if (name == "east_slavic") return PluralRule::east_slavic;
	if (name == "other") return PluralRule::other;
	UTK_THROW(DataError, "locale \"" + id + "\": unknown plural rule \"" + name + "\"");
}

LocaleData JsonLocaleProvider::parse_document(const std::string &json, const std::string &id) {
	rj::Document doc;
	doc.Parse(json.c_str());
	if (doc.HasParseError())
		UTK_THROW(DataError, "locale \"" + id + "\": " + rj::GetParseError_En(doc.GetParseError()) +
								 " at offset " + std::to_string(doc.GetErrorOffset()));

	LocaleData data{};
	data.id = id;

	const rj::Value &rule = member(doc, "plural_rule", id);
	if (!rule.IsString()) UTK_THROW(DataError, "locale \"" + id + "\": plural_rule is no string");
	data.plural_rule = plural_rule_from_string(rule.GetString(), id);

	const rj::Value &months = member(doc, "months", id);
	data.months_wide = string_array<12>(member(months, "wide", id), "months.wide", id);
	data.months_abbreviated =
		string_array<12>(member(months, "abbreviated", id), "months.abbreviated", id);

	const rj::Value &weekdays = member(doc, "weekdays", id);
	data.weekdays_wide = string_array<7>(member(weekdays, "wide", id), "weekdays.wide", id);
	data.weekdays_abbreviated =
		string_array<7>(member(weekdays, "abbreviated", id), "weekdays.abbreviated", id);

	data.day_periods = string_array<2>(member(doc, "day_periods", id), "day_periods", id);

	const rj::Value &units = member(doc, "units", id);
	for (size_t s = 0; s < 3; s++) {
		const rj::Value &style = member(units, s_style_names[s], id);
		for (const char *const unit : s_unit_names) {
			const std::string where = std::string{s_style_names[s]} + "." + unit;
			const rj::Value &entry = member(style, unit, id);
			LocaleData::Phrases phrases{};
			phrases.plain = plural_forms(entry, where, id);
			phrases.future = plural_forms(member(entry, "future", id), where + ".future", id);
			phrases.past = plural_forms(member(entry, "past", id), where + ".past", id);
			data.units[s].emplace(unit, std::move(phrases));
		}
	}
	return data;
}

// ============================================================================
// JsonLocaleProvider
// ============================================================================

JsonLocaleProvider::JsonLocaleProvider(std::filesystem::path directory)
	: m_directory(std::move(directory)) {}

// "de-AT" -> {"de_AT", "de"}
static std::vector<std::string> candidates(const std::string &locale) {
	std::string id = locale;
	std::replace(id.begin(), id.end(), '-', '_');
	if (id.empty() || id.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"
										   "0123456789_") != std::string::npos)
		UTK_THROW(InvalidValueError, "invalid locale identifier \"" + locale + "\"");
	if (id == "C" || id == "POSIX" || iequals(id, "en_US_POSIX")) return {"en"};
	std::vector<std::string> out{id};
	const auto underscore = id.find('_');
	if (underscore != std::string::npos) out.push_back(id.substr(0, underscore));
	return out;
}

std::shared_ptr<const LocaleData> JsonLocaleProvider::load(const std::string &locale) const {
	const std::filesystem::path directory =
		m_directory.empty() ? config::get_locale_path() : m_directory;
	for (const auto &id : candidates(locale)) {
		const auto file = directory / (id + ".json");
		std::ifstream in{file, std::ios::binary};
		if (!in) {
			log_verbose("no locale file ", file.string());
			continue;
		}
		std::ostringstream content;
		content << in.rdbuf();
		if (in.bad()) UTK_THROW(DataError, "failed to read " + file.string());
		log_verbose("loading locale ", id, " from ", file.string());
		return std::make_shared<const LocaleData>(parse_document(content.str(), id));
	}
	UTK_THROW(InvalidValueError,
			  "unknown locale \"" + locale + "\" (searched " + directory.string() + ")");
}

std::shared_ptr<const LocaleData> JsonLocaleProvider::resolve(const std::string &locale) const {
	const std::lock_guard lock{m_lock};
	const auto cached = m_cache.find(locale);
	if (cached != m_cache.end()) return cached->second;
	auto data = load(locale);
	m_cache.emplace(locale, data);
	return data;
}

std::shared_ptr<const LocaleData> UtcTimeKit::calendar::resolve_locale(const LocaleProvider &locales,
																	 const std::string &locale) {
	if (!locale.empty()) return locales.resolve(locale);
	const std::string configured = config::get_default_locale();
	try {
		return locales.resolve(configured);
	} catch (const InvalidValueError &) {
		if (configured == "en") throw;
		log_verbose("default locale \"", configured, "\" has no name tables, using en");
	}
	return locales.resolve("en");
}

const LocaleProvider &UtcTimeKit::calendar::default_locale_provider(void) {
	static const JsonLocaleProvider provider{};
	return provider;
}
