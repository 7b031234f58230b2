// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

/*
 * Reinterpretation of classified attribute values for the accessors
 * of tag records.  These never throw; a value of the wrong shape
 * yields std::nullopt.
 */

#ifndef HLS_REINTERPRET_HXX
#define HLS_REINTERPRET_HXX

#include "EnumeratedString.hxx"
#include "EnumeratedStringList.hxx"
#include "time/DateTime.hxx"
#include "value/AttributeValue.hxx"
#include "value/TagValue.hxx"

#include <optional>
#include <string_view>

namespace Hls {

template<typename T>
[[gnu::pure]]
std::optional<EnumeratedString<T>>
GetUnquotedEnumerated(const AttributeValue &value) noexcept
{
	const auto s = GetUnquotedString(value);
	if (!s)
		return std::nullopt;

	return EnumeratedString<T>{*s};
}

template<typename T>
[[gnu::pure]]
std::optional<EnumeratedString<T>>
GetQuotedEnumerated(const AttributeValue &value) noexcept
{
	const auto s = GetQuotedString(value);
	if (!s)
		return std::nullopt;

	return EnumeratedString<T>{*s};
}

template<typename T>
[[gnu::pure]]
std::optional<EnumeratedStringList<T>>
GetQuotedEnumeratedList(const AttributeValue &value) noexcept
{
	const auto s = GetQuotedString(value);
	if (!s)
		return std::nullopt;

	return EnumeratedStringList<T>{*s};
}

/**
 * Interpret a quoted "<n>[@<o>]".
 */
[[gnu::pure]]
std::optional<DecimalIntegerRange>
GetQuotedDecimalIntegerRange(const AttributeValue &value) noexcept;

[[gnu::pure]]
std::optional<DateTime>
GetQuotedDateTime(const AttributeValue &value) noexcept;

} // namespace Hls

#endif
