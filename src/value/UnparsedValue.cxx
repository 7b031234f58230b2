// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "TagValue.hxx"
#include "SyntaxError.hxx"
#include "time/DateTime.hxx"
#include "util/ByteSearch.hxx"
#include "util/NumberParser.hxx"
#include "util/StringSplit.hxx"

#include <fmt/format.h>

#include <charconv>
#include <stdexcept>
#include <utility> // for std::unreachable()

namespace Hls {

std::string_view
GetPlaylistTypeString(PlaylistTypeValue type) noexcept
{
	switch (type) {
	case PlaylistTypeValue::VOD:
		return "VOD";

	case PlaylistTypeValue::EVENT:
		return "EVENT";
	}

	std::unreachable();
}

std::string
FormatDecimalIntegerRange(const DecimalIntegerRange &range)
{
	if (range.offset)
		return fmt::format("{}@{}", range.length, *range.offset);
	else
		return fmt::format("{}", range.length);
}

std::string
FormatDecimalFloat(double value)
{
	/* enough for the longest fixed notation of a subnormal */
	char buffer[1024];

	const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer),
					     value, std::chars_format::fixed);
	if (ec != std::errc{})
		return fmt::format("{}", value);

	return {buffer, ptr};
}

static uint64_t
ParseDecimalInteger(std::string_view s, const char *what)
{
	const auto value = ParseInteger<uint64_t>(s);
	if (!value)
		throw std::invalid_argument(fmt::format("Invalid {}: '{}'",
							what, s));

	return *value;
}

uint64_t
UnparsedValue::AsDecimalInteger() const
{
	return ParseDecimalInteger(value, "decimal integer");
}

DecimalIntegerRange
UnparsedValue::AsDecimalIntegerRange() const
{
	const auto at = FindChar(value, '@');
	if (at == value.npos)
		return {ParseDecimalInteger(value, "length"), std::nullopt};

	const auto [length, offset] = PartitionWithout(value, at);
	return {
		ParseDecimalInteger(length, "length"),
		ParseDecimalInteger(offset, "offset"),
	};
}

PlaylistTypeValue
UnparsedValue::AsPlaylistType() const
{
	if (value == "VOD")
		return PlaylistTypeValue::VOD;
	else if (value == "EVENT")
		return PlaylistTypeValue::EVENT;
	else
		throw std::invalid_argument(fmt::format("Invalid playlist type: '{}'",
							value));
}

double
UnparsedValue::AsDecimalFloatingPoint() const
{
	const auto d = ParseDouble(value);
	if (!d)
		throw SyntaxError{SyntaxErrorCode::INVALID_FLOAT_FOR_DECIMAL_FLOATING_POINT};

	return *d;
}

DateTime
UnparsedValue::AsDateTime() const
{
	return ParseDateTime(value);
}

} // namespace Hls
