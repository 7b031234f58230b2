// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "DateTime.hxx"
#include "SyntaxError.hxx"
#include "util/CharUtil.hxx"
#include "util/NumberParser.hxx"

#include <fmt/format.h>

#include <iterator> // for std::back_inserter()

namespace Hls {

/**
 * Consume exactly #n decimal digits.
 */
template<typename T>
static T
ParseFixedDigits(std::string_view &s, std::size_t n, SyntaxErrorCode error)
{
	if (s.size() < n)
		throw SyntaxError{error};

	for (std::size_t i = 0; i < n; ++i)
		if (!IsDigitASCII(s[i]))
			throw SyntaxError{error};

	const auto value = ParseInteger<T>(s.substr(0, n));
	if (!value)
		throw SyntaxError{error};

	s.remove_prefix(n);
	return *value;
}

static void
ExpectSeparator(std::string_view &s, char a, char b, SyntaxErrorCode error)
{
	if (s.empty() || (s.front() != a && s.front() != b))
		throw SyntaxError{error};

	s.remove_prefix(1);
}

static void
ExpectSeparator(std::string_view &s, char ch, SyntaxErrorCode error)
{
	ExpectSeparator(s, ch, ch, error);
}

static bool
IsTimezoneStart(char ch) noexcept
{
	return ch == 'Z' || ch == 'z' || ch == '+' || ch == '-';
}

static TimezoneOffset
ParseTimezone(std::string_view s)
{
	if (s.empty())
		throw SyntaxError{SyntaxErrorCode::UNEXPECTED_NO_TIMEZONE};

	TimezoneOffset tz;

	const char sign = s.front();
	s.remove_prefix(1);

	if (sign == 'Z' || sign == 'z') {
		if (!s.empty())
			throw SyntaxError{SyntaxErrorCode::UNEXPECTED_CHARACTERS_AFTER_TIMEZONE};
		return tz;
	}

	const auto hour = ParseFixedDigits<unsigned>(s, 2,
						     SyntaxErrorCode::INVALID_TIMEZONE_HOUR);
	if (hour > 23)
		throw SyntaxError{SyntaxErrorCode::INVALID_TIMEZONE_HOUR};

	ExpectSeparator(s, ':', SyntaxErrorCode::UNEXPECTED_TIMEZONE_SEPARATOR);

	const auto minute = ParseFixedDigits<unsigned>(s, 2,
						       SyntaxErrorCode::INVALID_TIMEZONE_MINUTE);
	if (minute > 59)
		throw SyntaxError{SyntaxErrorCode::INVALID_TIMEZONE_MINUTE};

	if (!s.empty())
		throw SyntaxError{SyntaxErrorCode::UNEXPECTED_CHARACTERS_AFTER_TIMEZONE};

	tz.hour = static_cast<int8_t>(sign == '-' ? -int(hour) : int(hour));
	tz.minute = static_cast<uint8_t>(minute);
	return tz;
}

DateTime
ParseDateTime(std::string_view s)
{
	DateTime dt;

	dt.year = ParseFixedDigits<uint32_t>(s, 4, SyntaxErrorCode::INVALID_YEAR);
	ExpectSeparator(s, '-', SyntaxErrorCode::UNEXPECTED_YEAR_TO_MONTH_SEPARATOR);

	dt.month = ParseFixedDigits<uint8_t>(s, 2, SyntaxErrorCode::INVALID_MONTH);
	if (dt.month < 1 || dt.month > 12)
		throw SyntaxError{SyntaxErrorCode::INVALID_MONTH};
	ExpectSeparator(s, '-', SyntaxErrorCode::UNEXPECTED_MONTH_TO_DAY_SEPARATOR);

	dt.day = ParseFixedDigits<uint8_t>(s, 2, SyntaxErrorCode::INVALID_DAY);
	if (dt.day < 1 || dt.day > 31)
		throw SyntaxError{SyntaxErrorCode::INVALID_DAY};
	ExpectSeparator(s, 'T', 't', SyntaxErrorCode::UNEXPECTED_DAY_HOUR_SEPARATOR);

	dt.hour = ParseFixedDigits<uint8_t>(s, 2, SyntaxErrorCode::INVALID_HOUR);
	if (dt.hour > 23)
		throw SyntaxError{SyntaxErrorCode::INVALID_HOUR};
	ExpectSeparator(s, ':', SyntaxErrorCode::UNEXPECTED_HOUR_MINUTE_SEPARATOR);

	dt.minute = ParseFixedDigits<uint8_t>(s, 2, SyntaxErrorCode::INVALID_MINUTE);
	if (dt.minute > 59)
		throw SyntaxError{SyntaxErrorCode::INVALID_MINUTE};
	ExpectSeparator(s, ':', SyntaxErrorCode::UNEXPECTED_MINUTE_SECOND_SEPARATOR);

	/* the seconds run up to the timezone designator; a leap
	   second (60) is allowed */
	std::size_t i = 0;
	while (i < s.size() && !IsTimezoneStart(s[i]))
		++i;

	const auto second_text = s.substr(0, i);
	if (second_text.size() < 2 || !IsDigitASCII(second_text[0]) ||
	    !IsDigitASCII(second_text[1]))
		throw SyntaxError{SyntaxErrorCode::INVALID_SECOND};

	const auto second = ParseDouble(second_text);
	if (!second || *second < 0 || *second >= 61)
		throw SyntaxError{SyntaxErrorCode::INVALID_SECOND};

	dt.second = *second;
	dt.timezone = ParseTimezone(s.substr(i));
	return dt;
}

std::string
FormatDateTime(const DateTime &dt)
{
	auto result = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:06.3f}",
				  dt.year, dt.month, dt.day,
				  dt.hour, dt.minute, dt.second);

	if (dt.timezone.IsUTC())
		result.push_back('Z');
	else
		fmt::format_to(std::back_inserter(result), "{:+03}:{:02}",
			       dt.timezone.hour, dt.timezone.minute);

	return result;
}

} // namespace Hls
