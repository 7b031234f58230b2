// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_DATE_TIME_HXX
#define HLS_DATE_TIME_HXX

#include <cstdint>
#include <string>
#include <string_view>

namespace Hls {

struct TimezoneOffset {
	/**
	 * Hours relative to UTC, -23 to 23.
	 */
	int8_t hour = 0;

	uint8_t minute = 0;

	constexpr bool IsUTC() const noexcept {
		return hour == 0 && minute == 0;
	}

	bool operator==(const TimezoneOffset &) const noexcept = default;
};

/**
 * A calendar date and wall clock time as written in
 * EXT-X-PROGRAM-DATE-TIME and the EXT-X-DATERANGE dates.  No
 * validation of the calendar (e.g. February 30th) is done.
 */
struct DateTime {
	uint32_t year = 1970;
	uint8_t month = 1, day = 1;
	uint8_t hour = 0, minute = 0;

	/**
	 * Seconds including the fractional part.
	 */
	double second = 0;

	TimezoneOffset timezone;

	bool operator==(const DateTime &) const noexcept = default;
};

/**
 * Parse an ISO 8601 date-time with mandatory timezone, e.g.
 * "2025-06-04T13:50:42.148+03:00".
 *
 * Throws #SyntaxError on error.
 */
DateTime
ParseDateTime(std::string_view s);

/**
 * Format with millisecond precision; UTC is written as "Z".
 */
[[gnu::pure]]
std::string
FormatDateTime(const DateTime &dt);

} // namespace Hls

#endif
