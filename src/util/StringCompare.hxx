// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef STRING_COMPARE_HXX
#define STRING_COMPARE_HXX

#include <string_view>

/**
 * If the string begins with the given prefix, remove it and return
 * true.
 */
inline bool
SkipPrefix(std::string_view &haystack, std::string_view needle) noexcept
{
	bool match = haystack.starts_with(needle);
	if (match)
		haystack.remove_prefix(needle.size());
	return match;
}

inline bool
RemoveSuffix(std::string_view &haystack, std::string_view needle) noexcept
{
	bool match = haystack.ends_with(needle);
	if (match)
		haystack.remove_suffix(needle.size());
	return match;
}

#endif
