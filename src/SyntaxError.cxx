// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SyntaxError.hxx"

#include <fmt/format.h>

#include <utility> // for std::unreachable()

namespace Hls {

SyntaxErrorCategory
GetSyntaxErrorCategory(SyntaxErrorCode code) noexcept
{
	switch (code) {
	case SyntaxErrorCode::CARRIAGE_RETURN_WITHOUT_LINE_FEED:
	case SyntaxErrorCode::UNEXPECTED_END_OF_LINE:
	case SyntaxErrorCode::INVALID_UTF8:
		return SyntaxErrorCategory::GENERIC;

	case SyntaxErrorCode::NO_TAG_NAME:
		return SyntaxErrorCategory::UNKNOWN_TAG;

	case SyntaxErrorCode::INVALID_YEAR:
	case SyntaxErrorCode::UNEXPECTED_YEAR_TO_MONTH_SEPARATOR:
	case SyntaxErrorCode::INVALID_MONTH:
	case SyntaxErrorCode::UNEXPECTED_MONTH_TO_DAY_SEPARATOR:
	case SyntaxErrorCode::INVALID_DAY:
	case SyntaxErrorCode::UNEXPECTED_DAY_HOUR_SEPARATOR:
	case SyntaxErrorCode::INVALID_HOUR:
	case SyntaxErrorCode::UNEXPECTED_HOUR_MINUTE_SEPARATOR:
	case SyntaxErrorCode::INVALID_MINUTE:
	case SyntaxErrorCode::UNEXPECTED_MINUTE_SECOND_SEPARATOR:
	case SyntaxErrorCode::INVALID_SECOND:
	case SyntaxErrorCode::UNEXPECTED_NO_TIMEZONE:
	case SyntaxErrorCode::UNEXPECTED_CHARACTERS_AFTER_TIMEZONE:
	case SyntaxErrorCode::INVALID_TIMEZONE_HOUR:
	case SyntaxErrorCode::UNEXPECTED_TIMEZONE_SEPARATOR:
	case SyntaxErrorCode::INVALID_TIMEZONE_MINUTE:
		return SyntaxErrorCategory::DATE_TIME;

	case SyntaxErrorCode::INVALID_FLOAT_FOR_DECIMAL_FLOATING_POINT:
	case SyntaxErrorCode::UNEXPECTED_END_OF_LINE_WHILE_READING_ATTRIBUTE_NAME:
	case SyntaxErrorCode::UNEXPECTED_CHARACTER_IN_ATTRIBUTE_NAME:
	case SyntaxErrorCode::EMPTY_ATTRIBUTE_NAME:
	case SyntaxErrorCode::UNEXPECTED_EMPTY_ATTRIBUTE_VALUE:
	case SyntaxErrorCode::UNEXPECTED_END_OF_LINE_WITHIN_QUOTED_STRING:
	case SyntaxErrorCode::UNEXPECTED_CHARACTER_AFTER_QUOTED_STRING:
	case SyntaxErrorCode::INVALID_FLOAT_IN_ATTRIBUTE_VALUE:
		return SyntaxErrorCategory::TAG_VALUE;
	}

	std::unreachable();
}

std::string_view
GetSyntaxErrorMessage(SyntaxErrorCode code) noexcept
{
	switch (code) {
	case SyntaxErrorCode::CARRIAGE_RETURN_WITHOUT_LINE_FEED:
		return "Carriage return without line feed";

	case SyntaxErrorCode::UNEXPECTED_END_OF_LINE:
		return "Unexpected end of line";

	case SyntaxErrorCode::INVALID_UTF8:
		return "Invalid UTF-8";

	case SyntaxErrorCode::NO_TAG_NAME:
		return "Tag marker without a name";

	case SyntaxErrorCode::INVALID_YEAR:
		return "Invalid year in date";

	case SyntaxErrorCode::UNEXPECTED_YEAR_TO_MONTH_SEPARATOR:
		return "Expected '-' after year";

	case SyntaxErrorCode::INVALID_MONTH:
		return "Invalid month in date";

	case SyntaxErrorCode::UNEXPECTED_MONTH_TO_DAY_SEPARATOR:
		return "Expected '-' after month";

	case SyntaxErrorCode::INVALID_DAY:
		return "Invalid day in date";

	case SyntaxErrorCode::UNEXPECTED_DAY_HOUR_SEPARATOR:
		return "Expected 'T' after day";

	case SyntaxErrorCode::INVALID_HOUR:
		return "Invalid hour in time";

	case SyntaxErrorCode::UNEXPECTED_HOUR_MINUTE_SEPARATOR:
		return "Expected ':' after hour";

	case SyntaxErrorCode::INVALID_MINUTE:
		return "Invalid minute in time";

	case SyntaxErrorCode::UNEXPECTED_MINUTE_SECOND_SEPARATOR:
		return "Expected ':' after minute";

	case SyntaxErrorCode::INVALID_SECOND:
		return "Invalid second in time";

	case SyntaxErrorCode::UNEXPECTED_NO_TIMEZONE:
		return "Missing timezone";

	case SyntaxErrorCode::UNEXPECTED_CHARACTERS_AFTER_TIMEZONE:
		return "Garbage after timezone";

	case SyntaxErrorCode::INVALID_TIMEZONE_HOUR:
		return "Invalid timezone hour";

	case SyntaxErrorCode::UNEXPECTED_TIMEZONE_SEPARATOR:
		return "Expected ':' in timezone";

	case SyntaxErrorCode::INVALID_TIMEZONE_MINUTE:
		return "Invalid timezone minute";

	case SyntaxErrorCode::INVALID_FLOAT_FOR_DECIMAL_FLOATING_POINT:
		return "Invalid decimal floating point value";

	case SyntaxErrorCode::UNEXPECTED_END_OF_LINE_WHILE_READING_ATTRIBUTE_NAME:
		return "Unexpected end of line while reading attribute name";

	case SyntaxErrorCode::UNEXPECTED_CHARACTER_IN_ATTRIBUTE_NAME:
		return "Unexpected character in attribute name";

	case SyntaxErrorCode::EMPTY_ATTRIBUTE_NAME:
		return "Empty attribute name";

	case SyntaxErrorCode::UNEXPECTED_EMPTY_ATTRIBUTE_VALUE:
		return "Empty attribute value";

	case SyntaxErrorCode::UNEXPECTED_END_OF_LINE_WITHIN_QUOTED_STRING:
		return "Unterminated quoted string";

	case SyntaxErrorCode::UNEXPECTED_CHARACTER_AFTER_QUOTED_STRING:
		return "Unexpected character after quoted string";

	case SyntaxErrorCode::INVALID_FLOAT_IN_ATTRIBUTE_VALUE:
		return "Invalid floating point attribute value";
	}

	std::unreachable();
}

SyntaxError::SyntaxError(SyntaxErrorCode _code)
	:std::runtime_error(std::string{GetSyntaxErrorMessage(_code)}),
	 code(_code) {}

SyntaxError::SyntaxError(SyntaxErrorCode _code, char _character)
	:std::runtime_error(fmt::format("{}: '{}'",
					GetSyntaxErrorMessage(_code),
					_character)),
	 code(_code), character(_character) {}

} // namespace Hls
