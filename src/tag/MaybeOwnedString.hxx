// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_MAYBE_OWNED_STRING_HXX
#define HLS_MAYBE_OWNED_STRING_HXX

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace Hls {

/**
 * A string which either points into the caller's input buffer or
 * owns its characters.
 */
class MaybeOwnedString {
	std::variant<std::string_view, std::string> value;

public:
	MaybeOwnedString() noexcept = default;

	explicit MaybeOwnedString(std::string_view _value) noexcept
		:value(_value) {}

	explicit MaybeOwnedString(const char *_value) noexcept
		:value(std::string_view{_value}) {}

	explicit MaybeOwnedString(std::string &&_value) noexcept
		:value(std::move(_value)) {}

	bool IsOwned() const noexcept {
		return std::holds_alternative<std::string>(value);
	}

	std::string_view Get() const noexcept {
		if (const auto *s = std::get_if<std::string>(&value))
			return *s;
		return std::get<std::string_view>(value);
	}

	/**
	 * Copy the characters unless they are already owned.
	 */
	std::string ToString() && {
		if (auto *s = std::get_if<std::string>(&value))
			return std::move(*s);
		return std::string{std::get<std::string_view>(value)};
	}

	bool operator==(std::string_view other) const noexcept {
		return Get() == other;
	}
};

/**
 * The finalized output line of a tag, without line terminator.
 */
using TagInner = MaybeOwnedString;

} // namespace Hls

#endif
