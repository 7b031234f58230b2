// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_ENUMERATED_STRING_HXX
#define HLS_ENUMERATED_STRING_HXX

#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>
#include <variant>

namespace Hls {

/**
 * Specialize this for each enum usable with #EnumeratedString.  It
 * must provide a static array "names" indexed by the enum value.
 */
template<typename T>
struct EnumeratedStringTraits;

template<typename T>
[[gnu::pure]]
constexpr std::optional<T>
ParseEnumeratedValue(std::string_view s) noexcept
{
	const auto &names = EnumeratedStringTraits<T>::names;
	for (std::size_t i = 0; i < std::size(names); ++i)
		if (s == names[i])
			return T(i);

	return std::nullopt;
}

template<typename T>
[[gnu::const]]
constexpr std::string_view
GetEnumeratedValueString(T value) noexcept
{
	return EnumeratedStringTraits<T>::names[std::size_t(value)];
}

/**
 * A string value from a set of tokens which may be extended by
 * future versions of the format.  A token which is not (yet) known
 * is kept verbatim instead of being rejected.
 */
template<typename T>
class EnumeratedString {
	std::variant<T, std::string_view> value;

public:
	constexpr EnumeratedString(T known) noexcept
		:value(known) {}

	/**
	 * Classify the given token.  If it is unknown, the string is
	 * referenced, not copied.
	 */
	explicit constexpr EnumeratedString(std::string_view s) noexcept
		:value(std::string_view{})
	{
		if (const auto known = ParseEnumeratedValue<T>(s))
			value = *known;
		else
			value = s;
	}

	constexpr bool IsKnown() const noexcept {
		return std::holds_alternative<T>(value);
	}

	constexpr std::optional<T> GetKnown() const noexcept {
		if (const auto *known = std::get_if<T>(&value))
			return *known;
		return std::nullopt;
	}

	constexpr std::string_view AsString() const noexcept {
		if (const auto *known = std::get_if<T>(&value))
			return GetEnumeratedValueString(*known);
		return std::get<std::string_view>(value);
	}

	constexpr bool operator==(const EnumeratedString &other) const noexcept {
		return AsString() == other.AsString();
	}

	constexpr bool operator==(T other) const noexcept {
		return GetKnown() == other;
	}
};

} // namespace Hls

#endif
