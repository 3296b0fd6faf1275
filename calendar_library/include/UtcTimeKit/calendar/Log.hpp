// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef UTK_CALENDAR_LOG_HEADER
#define UTK_CALENDAR_LOG_HEADER

#include <iostream>
#include <utility>

#include "Common.hpp"

namespace UtcTimeKit::calendar {

	enum class Verbosity { quiet, normal, verbose };

	// Process wide. Starts from UTK_VERBOSITY ("quiet", "normal", "verbose"), quiet otherwise.
	EXPORT Verbosity get_verbosity(void);
	EXPORT void set_verbosity(Verbosity level);

	inline bool is_verbose(void) { return get_verbosity() == Verbosity::verbose; }
	inline bool is_quiet(void) { return get_verbosity() == Verbosity::quiet; }

	template <typename... Args> void log_info(Args &&...args) // hidden in quiet mode
	{
		if (!is_quiet()) {
			std::clog << "utk: ";
			(std::clog << ... << std::forward<Args>(args)) << std::endl;
		}
	}

	template <typename... Args> void log_verbose(Args &&...args) // only in verbose mode
	{
		if (is_verbose()) {
			std::clog << "utk: ";
			(std::clog << ... << std::forward<Args>(args)) << std::endl;
		}
	}

	template <typename... Args> void log_error(Args &&...args) // always shown
	{
		std::cerr << "utk: ";
		(std::cerr << ... << std::forward<Args>(args)) << std::endl;
	}

} // namespace UtcTimeKit::calendar

#endif
