// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#pragma once

#include <algorithm>
#include <string>
#include <string_view>

#include "inline.hpp"

namespace UtcTimeKit::calendar::source::low_level {

	// ASCII only, other bytes (UTF-8 sequences included) pass through unchanged
	static inline std::string to_lower_ascii(std::string_view in) {
		std::string out{in};
		std::transform(out.begin(), out.end(), out.begin(), [](char c) {
			return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
		});
		return out;
	}

	static inline bool iequals(std::string_view a, std::string_view b) {
		return a.size() == b.size() && to_lower_ascii(a) == to_lower_ascii(b);
	}

	static inline std::string_view trim(std::string_view in) {
		constexpr std::string_view blanks = " \t\n\r\f\v";
		const auto first = in.find_first_not_of(blanks);
		if (first == std::string_view::npos) return {};
		const auto last = in.find_last_not_of(blanks);
		return in.substr(first, last - first + 1);
	}

	// replace every "{0}" in pattern
	static inline std::string substitute(const std::string &pattern, const std::string &value) {
		std::string out;
		out.reserve(pattern.size() + value.size());
		size_t pos = 0;
		for (;;) {
			const auto hit = pattern.find("{0}", pos);
			if (hit == std::string::npos) break;
			out.append(pattern, pos, hit - pos);
			out += value;
			pos = hit + 3;
		}
		out.append(pattern, pos, std::string::npos);
		return out;
	}

} // namespace UtcTimeKit::calendar::source::low_level
