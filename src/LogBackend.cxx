// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LogBackend.hxx"
#include "Log.hxx"
#include "util/Domain.hxx"
#include "util/StringStrip.hxx"

#include <fmt/chrono.h>

#include <cstdio>
#include <ctime>

using std::string_view_literals::operator""sv;

static LogLevel log_threshold = LogLevel::NOTICE;

static bool enable_timestamp;

void
SetLogThreshold(LogLevel _threshold) noexcept
{
	log_threshold = _threshold;
}

LogLevel
GetLogThreshold() noexcept
{
	return log_threshold;
}

void
EnableLogTimestamp() noexcept
{
	enable_timestamp = true;
}

static std::string_view
log_date() noexcept
{
	static constexpr std::size_t LOG_DATE_BUF_SIZE = std::char_traits<char>::length("2025-01-22T15:43:14 ") + 1;
	static char buf[LOG_DATE_BUF_SIZE];
	std::time_t t = std::time(nullptr);
	const auto *tm = std::localtime(&t);
	if (tm == nullptr)
		return {};

	const auto result = fmt::format_to_n(buf, sizeof(buf) - 1,
					     "{:%FT%T} ", *tm);
	return {buf, result.size < sizeof(buf) ? result.size : sizeof(buf) - 1};
}

static void
FileLog(const Domain &domain, std::string_view message) noexcept
{
	fmt::print(stderr, "{}{}: {}\n",
		   enable_timestamp ? log_date() : ""sv,
		   domain.GetName(),
		   StripRight(message));
}

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept
{
	if (level < log_threshold)
		return;

	FileLog(domain, msg);
}
