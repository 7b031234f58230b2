// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_DECIMAL_RESOLUTION_HXX
#define HLS_DECIMAL_RESOLUTION_HXX

#include "AttributeValue.hxx"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Hls {

/**
 * A video resolution written as "<width>x<height>".
 */
struct DecimalResolution {
	uint64_t width = 0, height = 0;

	bool operator==(const DecimalResolution &) const noexcept = default;
};

[[gnu::pure]]
std::optional<DecimalResolution>
ParseDecimalResolution(std::string_view s) noexcept;

[[gnu::pure]]
inline std::optional<DecimalResolution>
GetDecimalResolution(const AttributeValue &value) noexcept
{
	const auto s = GetUnquotedString(value);
	if (!s)
		return std::nullopt;

	return ParseDecimalResolution(*s);
}

std::string
FormatDecimalResolution(DecimalResolution r);

} // namespace Hls

#endif
