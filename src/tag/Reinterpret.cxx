// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Reinterpret.hxx"
#include "SyntaxError.hxx"

#include <stdexcept>

namespace Hls {

std::optional<DecimalIntegerRange>
GetQuotedDecimalIntegerRange(const AttributeValue &value) noexcept
{
	const auto s = GetQuotedString(value);
	if (!s)
		return std::nullopt;

	try {
		return UnparsedValue{*s}.AsDecimalIntegerRange();
	} catch (const std::invalid_argument &) {
		return std::nullopt;
	}
}

std::optional<DateTime>
GetQuotedDateTime(const AttributeValue &value) noexcept
{
	const auto s = GetQuotedString(value);
	if (!s)
		return std::nullopt;

	try {
		return ParseDateTime(*s);
	} catch (const SyntaxError &) {
		return std::nullopt;
	}
}

} // namespace Hls
