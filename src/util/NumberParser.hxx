// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "CharUtil.hxx"

#include <charconv>
#include <concepts>
#include <optional>
#include <string_view>

template<std::integral T>
[[gnu::pure]]
std::optional<T>
ParseInteger(std::string_view src, int base=10) noexcept
{
	const char *const last = src.data() + src.size();

	T value;
	auto [ptr, ec] = std::from_chars(src.data(), last, value, base);
	if (ptr == last && ec == std::errc{})
		return value;
	else
		return std::nullopt;
}

/**
 * Parse a decimal floating point number.  Unlike std::strtod(), the
 * whole string must be consumed, and "inf"/"nan" are not accepted.
 */
[[gnu::pure]]
inline std::optional<double>
ParseDouble(std::string_view src) noexcept
{
	if (src.empty())
		return std::nullopt;

	std::size_t digit = src.front() == '-' ? 1 : 0;
	if (digit >= src.size() ||
	    (!IsDigitASCII(src[digit]) && src[digit] != '.'))
		return std::nullopt;

	const char *const last = src.data() + src.size();

	double value;
	auto [ptr, ec] = std::from_chars(src.data(), last, value,
					 std::chars_format::general);
	if (ptr == last && ec == std::errc{})
		return value;
	else
		return std::nullopt;
}
