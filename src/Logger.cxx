// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"

#include <fmt/format.h>

#include <atomic>

#include <stdio.h>

static std::atomic_uint log_level{1};

bool
Logger::IsLogLevelVisible(unsigned level) noexcept
{
	return level <= log_level.load(std::memory_order_relaxed);
}

void
Logger::SetLogLevel(unsigned level) noexcept
{
	log_level.store(level, std::memory_order_relaxed);
}

void
Logger::Log(unsigned level, std::string_view msg) const
{
	if (!IsLogLevelVisible(level))
		return;

	fmt::print(stderr, "[{}] {}\n", GetLogName(), msg);
}

void
Logger::LogPrefix(unsigned level, std::string_view prefix,
		  std::string_view msg) const
{
	if (!IsLogLevelVisible(level))
		return;

	fmt::print(stderr, "[{}] {}: {}\n", GetLogName(), prefix, msg);
}

void
Logger::Log(unsigned level, std::string_view prefix,
	    const std::exception &e) const
{
	LogPrefix(level, prefix, e.what());
}
