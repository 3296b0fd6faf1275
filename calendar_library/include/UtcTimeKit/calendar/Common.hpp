// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef UTK_CALENDAR_COMMON_HEADER
#define UTK_CALENDAR_COMMON_HEADER

#if defined(__GNUC__) || defined(__clang__)
	#define EXPORT __attribute__((visibility("default")))
#else
	#define EXPORT
#endif

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace UtcTimeKit::calendar::exception {
	struct Exception : public std::exception {
		Exception(const std::string &msg, const char *file, unsigned long line)
			: message(msg + " at " + file + ":" + std::to_string(line))
			, bare(msg) {}
		const char *what() const noexcept override { return message.c_str(); }
		// message without the throw location
		const std::string &reason() const noexcept { return bare; }

	  private:
		std::string message;
		std::string bare;
	};
	struct UnsupportedTokenError : public Exception {
		UnsupportedTokenError(const std::string &msg, const char *file, unsigned long line)
			: Exception("UnsupportedTokenError: " + msg, file, line) {}
	};
	struct InvalidUnitError : public Exception {
		InvalidUnitError(const std::string &msg, const char *file, unsigned long line)
			: Exception("InvalidUnitError: " + msg, file, line) {}
	};
	struct RangeOverflowError : public Exception {
		RangeOverflowError(const std::string &msg, const char *file, unsigned long line)
			: Exception("RangeOverflowError: " + msg, file, line) {}
	};
	struct InvalidValueError : public Exception {
		InvalidValueError(const std::string &msg, const char *file, unsigned long line)
			: Exception("InvalidValueError: " + msg, file, line) {}
	};
	struct DataError : public Exception {
		DataError(const std::string &msg, const char *file, unsigned long line)
			: Exception("DataError: " + msg, file, line) {}
	};

	/**
	 * @brief One rejected candidate of a multi-candidate parse
	 */
	struct Attempt {
		std::string candidate;
		std::string reason;
	};
	using Attempts = std::vector<Attempt>;

	/**
	 * @brief No format or grammar candidate matched the value
	 *
	 * Carries the offending value and every attempted candidate, in the order they were tried,
	 * together with the reason each one was rejected.
	 */
	struct ParseError : public Exception {
		ParseError(const std::string &value, Attempts attempts, const char *file,
				   unsigned long line)
			: Exception("ParseError: " + describe(value, attempts), file, line)
			, m_value(value)
			, m_attempts(std::move(attempts)) {}

		const std::string &value() const noexcept { return m_value; }
		const Attempts &attempted() const noexcept { return m_attempts; }

	  private:
		static std::string describe(const std::string &value, const Attempts &attempts) {
			std::string out = "Value \"" + value + "\" does not match any format in [";
			for (size_t i = 0; i < attempts.size(); i++) {
				if (i) out += ", ";
				out += "\"" + attempts[i].candidate + "\" (" + attempts[i].reason + ")";
			}
			return out + "]";
		}

		std::string m_value;
		Attempts m_attempts;
	};

#define UTK_THROW(TYPE, MSG) throw TYPE(MSG, __FILE__, __LINE__)
#define UTK_THROW_PARSE(VALUE, ATTEMPTS) throw ParseError(VALUE, ATTEMPTS, __FILE__, __LINE__)

} // namespace UtcTimeKit::calendar::exception
#endif
