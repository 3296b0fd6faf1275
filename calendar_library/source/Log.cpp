// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "UtcTimeKit/calendar/Log.hpp"

#include <atomic>
#include <cstdlib>
#include <string_view>

using namespace UtcTimeKit::calendar;

static Verbosity verbosity_from_env(void) {
	const char *const env = std::getenv("UTK_VERBOSITY");
	if (env == nullptr) return Verbosity::quiet;
	const std::string_view value{env};
	if (value == "verbose") return Verbosity::verbose;
	if (value == "normal") return Verbosity::normal;
	return Verbosity::quiet;
}

static std::atomic<Verbosity> &verbosity_slot(void) {
	static std::atomic<Verbosity> g_verbosity{verbosity_from_env()};
	return g_verbosity;
}

Verbosity UtcTimeKit::calendar::get_verbosity(void) {
	return verbosity_slot().load(std::memory_order_relaxed);
}

void UtcTimeKit::calendar::set_verbosity(Verbosity level) {
	verbosity_slot().store(level, std::memory_order_relaxed);
}
