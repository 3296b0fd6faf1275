// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#pragma once

#include <array>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "inline.hpp"

namespace UtcTimeKit::calendar::source::low_level {

	// write v as decimal into buf backwards; returns pointer to first digit
	static INLINE char *write_digits_rev(char *buf_end, uint64_t v) {
		char *p = buf_end;
		do {
			*--p = char('0' + (v % 10));
			v /= 10;
		} while (v);
		return p;
	}

	// append v zero padded to at least width digits, with a leading '-' when negative
	static INLINE void append_padded(std::string &out, int64_t v, size_t width) {
		std::array<char, 24> buf{};
		char *const end = buf.data() + buf.size();
		const uint64_t magnitude =
			v < 0 ? static_cast<uint64_t>(-(v + 1)) + 1 : static_cast<uint64_t>(v);
		const char *const start = write_digits_rev(end, magnitude);
		const size_t digits = static_cast<size_t>(end - start);
		if (v < 0) out.push_back('-');
		if (digits < width) out.append(width - digits, '0');
		out.append(start, digits);
	}

	// "+HHMM" or "+HH:MM"; seconds of the offset are dropped
	static inline std::string format_offset(int32_t offset_seconds, bool colon) {
		std::string out;
		out.push_back(offset_seconds < 0 ? '-' : '+');
		const int32_t magnitude = std::abs(offset_seconds);
		append_padded(out, magnitude / 3600, 2);
		if (colon) out.push_back(':');
		append_padded(out, (magnitude % 3600) / 60, 2);
		return out;
	}

	// shortest text that reads back to the same double
	static inline std::string format_double(double value) {
		std::array<char, 32> buf{};
		const auto result = std::to_chars(buf.data(), buf.data() + buf.size(), value);
		return std::string(buf.data(), result.ptr);
	}

} // namespace UtcTimeKit::calendar::source::low_level
