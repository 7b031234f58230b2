// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_BYTE_SEARCH_HXX
#define HLS_BYTE_SEARCH_HXX

#include <bit>
#include <cstdint>
#include <cstring>
#include <string_view>

/**
 * Word-at-a-time byte search helpers.  Eight bytes are loaded into
 * one 64 bit integer and compared against all needles at once; the
 * lowest set bit of the resulting mask marks the first match.
 */
namespace ByteSearchDetail {

constexpr std::uint64_t
RepeatByte(std::uint8_t b) noexcept
{
	return 0x0101010101010101ULL * b;
}

/**
 * Returns a mask with the high bit of each zero byte set.  Bits above
 * the first zero byte may be false positives, but the lowest set bit
 * is always exact.
 */
constexpr std::uint64_t
HasZeroByte(std::uint64_t v) noexcept
{
	return (v - 0x0101010101010101ULL) & ~v & 0x8080808080808080ULL;
}

constexpr std::uint64_t
HasByte(std::uint64_t v, char b) noexcept
{
	return HasZeroByte(v ^ RepeatByte(static_cast<std::uint8_t>(b)));
}

inline std::uint64_t
LoadWord(const char *p) noexcept
{
	std::uint64_t v;
	std::memcpy(&v, p, sizeof(v));
	return v;
}

} // namespace ByteSearchDetail

/**
 * Find the first occurrence of any of the three given characters.
 *
 * @return the position or std::string_view::npos
 */
[[gnu::pure]]
inline std::size_t
FindFirstOf(std::string_view haystack, char a, char b, char c) noexcept
{
	using namespace ByteSearchDetail;

	const char *const begin = haystack.data();
	const char *p = begin;
	const char *const end = begin + haystack.size();

	if constexpr (std::endian::native == std::endian::little) {
		for (; end - p >= 8; p += 8) {
			const auto word = LoadWord(p);
			const auto mask = HasByte(word, a) | HasByte(word, b) |
				HasByte(word, c);
			if (mask != 0)
				return (p - begin) + (std::countr_zero(mask) >> 3);
		}
	}

	for (; p != end; ++p)
		if (*p == a || *p == b || *p == c)
			return p - begin;

	return haystack.npos;
}

/**
 * Like FindFirstOf(), but with two characters.
 */
[[gnu::pure]]
inline std::size_t
FindFirstOf(std::string_view haystack, char a, char b) noexcept
{
	return FindFirstOf(haystack, a, b, b);
}

/**
 * A memchr() wrapper for std::string_view.
 *
 * @return the position or std::string_view::npos
 */
[[gnu::pure]]
inline std::size_t
FindChar(std::string_view haystack, char ch) noexcept
{
	if (haystack.empty())
		return haystack.npos;

	const void *p = std::memchr(haystack.data(), ch, haystack.size());
	if (p == nullptr)
		return haystack.npos;

	return static_cast<const char *>(p) - haystack.data();
}

#endif
