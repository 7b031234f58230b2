// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "UTF8.hxx"
#include "CharUtil.hxx"

#include <cstdint>

/**
 * Is this a leading byte that is followed by 1 continuation byte?
 */
static constexpr bool
IsLeading1(uint8_t ch) noexcept
{
	return (ch & 0xe0) == 0xc0;
}

/**
 * Is this a leading byte that is followed by 2 continuation byte?
 */
static constexpr bool
IsLeading2(uint8_t ch) noexcept
{
	return (ch & 0xf0) == 0xe0;
}

/**
 * Is this a leading byte that is followed by 3 continuation byte?
 */
static constexpr bool
IsLeading3(uint8_t ch) noexcept
{
	return (ch & 0xf8) == 0xf0;
}

static constexpr bool
IsContinuation(uint8_t ch) noexcept
{
	return (ch & 0xc0) == 0x80;
}

/**
 * Check that the given number of continuation bytes follow.
 */
static bool
SkipContinuations(const char *&p, const char *end, unsigned n) noexcept
{
	if (end - p <= static_cast<std::ptrdiff_t>(n))
		return false;

	for (unsigned i = 0; i < n; ++i)
		if (!IsContinuation(*++p))
			return false;

	return true;
}

bool
ValidateUTF8(std::string_view s) noexcept
{
	const char *p = s.data();
	const char *const end = p + s.size();

	for (; p != end; ++p) {
		uint8_t ch = *p;
		if (IsASCII(ch))
			continue;

		if (IsContinuation(ch))
			/* continuation without a prefix */
			return false;

		unsigned n;
		if (IsLeading1(ch))
			n = 1;
		else if (IsLeading2(ch))
			n = 2;
		else if (IsLeading3(ch))
			n = 3;
		else
			return false;

		if (!SkipContinuations(p, end, n))
			return false;
	}

	return true;
}
