// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <exception>
#include <string>
#include <string_view>
#include <utility>

/**
 * Prints "[name] message" lines to stderr if the message's level is
 * visible.  Level 1 is for errors, level 5 for debug noise.
 */
class Logger {
	mutable std::string log_name;

public:
	virtual ~Logger() noexcept = default;

	const std::string &GetLogName() const noexcept {
		if (log_name.empty())
			log_name = MakeLogName();
		return log_name;
	}

	static bool IsLogLevelVisible(unsigned level) noexcept;

	/**
	 * Set the process-wide verbosity threshold.  Messages with a
	 * level above it are discarded.
	 */
	static void SetLogLevel(unsigned level) noexcept;

	void Log(unsigned level, std::string_view msg) const;

	void LogPrefix(unsigned level, std::string_view prefix,
		       std::string_view msg) const;

	void Log(unsigned level, std::string_view prefix,
		 const std::exception &e) const;

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const {
		if (IsLogLevelVisible(level))
			Log(level, fmt::format(format_str,
					       std::forward<Args>(args)...));
	}

protected:
	Logger() noexcept = default;

	/**
	 * Construct with a known name.  GetLogName() will never
	 * modify the object, which makes a const instance safe to
	 * share between threads.
	 */
	explicit Logger(std::string _log_name) noexcept
		:log_name(std::move(_log_name)) {}

	virtual std::string MakeLogName() const noexcept = 0;
};

/**
 * A #Logger with a fixed, non-empty name.
 */
class NamedLogger final : public Logger {
public:
	explicit NamedLogger(std::string_view _name)
		:Logger(std::string{_name}) {}

protected:
	std::string MakeLogName() const noexcept override {
		/* not reached: the name was set by the constructor */
		return "fcgi";
	}
};
