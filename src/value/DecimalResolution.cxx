// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "DecimalResolution.hxx"
#include "util/ByteSearch.hxx"
#include "util/NumberParser.hxx"
#include "util/StringSplit.hxx"

#include <fmt/format.h>

namespace Hls {

std::optional<DecimalResolution>
ParseDecimalResolution(std::string_view s) noexcept
{
	const auto x = FindChar(s, 'x');
	if (x == s.npos)
		return std::nullopt;

	const auto [w, h] = PartitionWithout(s, x);
	const auto width = ParseInteger<uint64_t>(w);
	const auto height = ParseInteger<uint64_t>(h);
	if (!width || !height)
		return std::nullopt;

	return DecimalResolution{*width, *height};
}

std::string
FormatDecimalResolution(DecimalResolution r)
{
	return fmt::format("{}x{}", r.width, r.height);
}

} // namespace Hls
