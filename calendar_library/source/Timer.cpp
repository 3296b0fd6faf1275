// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "UtcTimeKit/calendar/Timer.hpp"

#include <utility>

#include "UtcTimeKit/calendar/Common.hpp"

using namespace UtcTimeKit::calendar;
using namespace UtcTimeKit::calendar::exception;

Timer::Timer(Duration timeout, Clock clock) : m_timeout(timeout), m_clock(std::move(clock)) {
	if (!m_clock) UTK_THROW(InvalidValueError, "timer needs a clock");
}

Timer &Timer::start() {
	const Instant now = m_clock();
	// resume: keep what was measured before the last stop
	Duration offset{};
	if (m_started_at && m_stopped_at && *m_started_at < *m_stopped_at)
		offset = *m_stopped_at - *m_started_at;
	m_started_at = now - offset;
	m_stopped_at.reset();
	return *this;
}

Timer &Timer::stop() {
	m_stopped_at = m_clock();
	return *this;
}

Timer &Timer::reset() {
	m_started_at.reset();
	m_stopped_at.reset();
	return *this;
}

bool Timer::started() const noexcept {
	return m_started_at && (!m_stopped_at || *m_stopped_at < *m_started_at);
}

bool Timer::stopped() const noexcept {
	return !m_started_at || (m_stopped_at && *m_stopped_at >= *m_started_at);
}

Duration Timer::elapsed() const {
	if (!m_started_at) return Duration{};
	if (stopped()) return *m_stopped_at - *m_started_at;
	return m_clock() - *m_started_at;
}

Duration Timer::remaining() const {
	return m_timeout - elapsed();
}

bool Timer::done() const {
	return elapsed() >= m_timeout;
}
