// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_SYNTAX_ERROR_HXX
#define HLS_SYNTAX_ERROR_HXX

#include <stdexcept>
#include <string_view>

namespace Hls {

enum class SyntaxErrorCategory {
	GENERIC,
	UNKNOWN_TAG,
	DATE_TIME,
	TAG_VALUE,
};

enum class SyntaxErrorCode {
	/* GENERIC */
	CARRIAGE_RETURN_WITHOUT_LINE_FEED,
	UNEXPECTED_END_OF_LINE,
	INVALID_UTF8,

	/* UNKNOWN_TAG */
	NO_TAG_NAME,

	/* DATE_TIME */
	INVALID_YEAR,
	UNEXPECTED_YEAR_TO_MONTH_SEPARATOR,
	INVALID_MONTH,
	UNEXPECTED_MONTH_TO_DAY_SEPARATOR,
	INVALID_DAY,
	UNEXPECTED_DAY_HOUR_SEPARATOR,
	INVALID_HOUR,
	UNEXPECTED_HOUR_MINUTE_SEPARATOR,
	INVALID_MINUTE,
	UNEXPECTED_MINUTE_SECOND_SEPARATOR,
	INVALID_SECOND,
	UNEXPECTED_NO_TIMEZONE,
	UNEXPECTED_CHARACTERS_AFTER_TIMEZONE,
	INVALID_TIMEZONE_HOUR,
	UNEXPECTED_TIMEZONE_SEPARATOR,
	INVALID_TIMEZONE_MINUTE,

	/* TAG_VALUE */
	INVALID_FLOAT_FOR_DECIMAL_FLOATING_POINT,
	UNEXPECTED_END_OF_LINE_WHILE_READING_ATTRIBUTE_NAME,
	UNEXPECTED_CHARACTER_IN_ATTRIBUTE_NAME,
	EMPTY_ATTRIBUTE_NAME,
	UNEXPECTED_EMPTY_ATTRIBUTE_VALUE,
	UNEXPECTED_END_OF_LINE_WITHIN_QUOTED_STRING,
	UNEXPECTED_CHARACTER_AFTER_QUOTED_STRING,
	INVALID_FLOAT_IN_ATTRIBUTE_VALUE,
};

[[gnu::const]]
SyntaxErrorCategory
GetSyntaxErrorCategory(SyntaxErrorCode code) noexcept;

[[gnu::const]]
std::string_view
GetSyntaxErrorMessage(SyntaxErrorCode code) noexcept;

/**
 * The input could not be tokenized.  These errors are never
 * retryable; the line that caused it has to be skipped as a whole.
 */
class SyntaxError : public std::runtime_error {
	SyntaxErrorCode code;

	/**
	 * The offending character, only set for
	 * SyntaxErrorCode::UNEXPECTED_CHARACTER_AFTER_QUOTED_STRING.
	 */
	char character = 0;

public:
	explicit SyntaxError(SyntaxErrorCode _code);

	SyntaxError(SyntaxErrorCode _code, char _character);

	SyntaxErrorCode GetCode() const noexcept {
		return code;
	}

	SyntaxErrorCategory GetCategory() const noexcept {
		return GetSyntaxErrorCategory(code);
	}

	char GetCharacter() const noexcept {
		return character;
	}

	static SyntaxError UnexpectedCharacterAfterQuotedString(char ch) {
		return {SyntaxErrorCode::UNEXPECTED_CHARACTER_AFTER_QUOTED_STRING, ch};
	}
};

} // namespace Hls

#endif
