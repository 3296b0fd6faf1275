// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "UtcTimeKit/calendar/Common.hpp"

namespace UtcTimeKit::calendar::source::low_level {

	struct TzifType {
		int32_t utoff;
		bool dst;
		std::string abbreviation;
	};

	// Transition table of one compiled zoneinfo file (RFC 8536)
	struct EXPORT TzifData {
		std::string name;
		std::vector<int64_t> transitions; // POSIX seconds, ascending
		std::vector<uint8_t> transition_types;
		std::vector<TzifType> types;
		std::string footer; // POSIX TZ rule of version 2+ files, kept for diagnostics

		/**
		 * @brief Type in effect at the given POSIX second
		 *
		 * The footer rule is not applied. After the last transition the type of that
		 * transition stays in effect, so "fat" files are exact up to 2037 and "slim" files
		 * stop following daylight saving time at their last listed transition.
		 */
		const TzifType &type_at(int64_t seconds) const noexcept;
	};

	class EXPORT TzifReader final {
	  public:
		static bool isTzifFile(const std::filesystem::path &path);
		// @throws DataError for unreadable or malformed content
		static TzifData read(const std::filesystem::path &path, const std::string &name);
		static TzifData parse(const std::vector<uint8_t> &data, const std::string &name);

		static constexpr uint8_t TZIF_MAGIC[4] = {'T', 'Z', 'i', 'f'};
		static constexpr size_t HEADER_SIZE = 44;

	  private:
		TzifReader() = delete;
	};

} // namespace UtcTimeKit::calendar::source::low_level
