// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <string_view>
#include <utility>

/**
 * Split the string at the given position; the character at that
 * position is omitted.
 */
constexpr std::pair<std::string_view, std::string_view>
PartitionWithout(const std::string_view haystack,
		 const std::string_view::size_type separator) noexcept
{
	return {
		haystack.substr(0, separator),
		haystack.substr(separator + 1),
	};
}

/**
 * Split the string at the first occurrence of the given character.
 * If the character is not found, then the first value is the whole
 * string and the second value is nullptr.
 */
constexpr std::pair<std::string_view, std::string_view>
Split(const std::string_view haystack, const char ch) noexcept
{
	const auto i = haystack.find(ch);
	if (i == haystack.npos)
		return {haystack, {}};

	return PartitionWithout(haystack, i);
}
