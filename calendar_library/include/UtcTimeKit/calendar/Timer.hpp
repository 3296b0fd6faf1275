// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef UTK_CALENDAR_TIMER_HEADER
#define UTK_CALENDAR_TIMER_HEADER

#include <functional>
#include <optional>

#include "Common.hpp"
#include "Duration.hpp"
#include "Instant.hpp"

namespace UtcTimeKit::calendar {

	/**
	 * @brief Stopwatch with an optional timeout
	 *
	 * start() after stop() resumes, the time spent stopped is not counted. A timer that was
	 * never started reports zero elapsed time and counts as stopped. The clock defaults to
	 * Instant::now() and can be replaced for deterministic use.
	 */
	class EXPORT Timer final {
	  public:
		using Clock = std::function<Instant()>;

		explicit Timer(Duration timeout = {}, Clock clock = &Instant::now);

		Timer &start();
		Timer &stop();
		// back to the never started state
		Timer &reset();

		[[nodiscard]] bool started() const noexcept;
		[[nodiscard]] bool stopped() const noexcept;

		[[nodiscard]] Duration elapsed() const;
		// timeout - elapsed, negative once the timeout has passed
		[[nodiscard]] Duration remaining() const;
		// elapsed >= timeout
		[[nodiscard]] bool done() const;

		[[nodiscard]] Duration timeout() const noexcept { return m_timeout; }

	  private:
		Duration m_timeout;
		Clock m_clock;
		std::optional<Instant> m_started_at{};
		std::optional<Instant> m_stopped_at{};
	};

	// starts the timer on construction and stops it when the scope ends
	class TimerScope final {
	  public:
		explicit TimerScope(Timer &timer) : m_timer(timer) { m_timer.start(); }
		~TimerScope() { m_timer.stop(); }

		TimerScope(const TimerScope &) = delete;
		TimerScope &operator=(const TimerScope &) = delete;

	  private:
		Timer &m_timer;
	};

} // namespace UtcTimeKit::calendar

#endif
