// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Enumerations.hxx"
#include "util/NumberParser.hxx"
#include "util/StringCompare.hxx"

namespace Hls {

std::optional<unsigned>
GetCea708ServiceNumber(const EnumeratedString<InstreamId> &id) noexcept
{
	if (id.IsKnown())
		return std::nullopt;

	auto number = id.AsString();
	if (!SkipPrefix(number, "SERVICE"))
		return std::nullopt;

	const auto n = ParseInteger<unsigned>(number);
	if (!n || *n < 1 || *n > 63)
		return std::nullopt;

	return n;
}

} // namespace Hls
