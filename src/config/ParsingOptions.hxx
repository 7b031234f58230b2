// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_PARSING_OPTIONS_HXX
#define HLS_PARSING_OPTIONS_HXX

#include "tag/Mask.hxx"

#include <string_view>

namespace Hls {

/**
 * Selects which tag names are converted into their typed record.
 * Names which are not selected are passed through as unknown tags,
 * which skips their validation.
 */
class ParsingOptions {
	TagNameMask mask = TagNameMask::All();

public:
	constexpr ParsingOptions() noexcept = default;

	explicit constexpr ParsingOptions(TagNameMask _mask) noexcept
		:mask(_mask) {}

	static constexpr ParsingOptions All() noexcept {
		return ParsingOptions{TagNameMask::All()};
	}

	static constexpr ParsingOptions None() noexcept {
		return ParsingOptions{TagNameMask::None()};
	}

	ParsingOptions &With(TagName name) noexcept {
		mask.Set(name);
		return *this;
	}

	ParsingOptions &Without(TagName name) noexcept {
		mask.Unset(name);
		return *this;
	}

	constexpr bool IsKnownNameEnabled(TagName name) const noexcept {
		return mask.Test(name);
	}

	constexpr TagNameMask GetMask() const noexcept {
		return mask;
	}

	constexpr bool operator==(const ParsingOptions &) const noexcept = default;
};

/**
 * Parse a configuration string: a comma separated list of tag names
 * (with or without the "#EXT" prefix; the dash after "#EXT" may be
 * omitted, e.g. "X-VERSION").  The first item may be "none" or
 * "all".  Items prefixed with "+" or "-" modify the default (all
 * enabled) instead of replacing it; thus "-X-VERSION" disables
 * "#EXT-X-VERSION".
 *
 * Throws std::invalid_argument on error.
 */
ParsingOptions
ParseParsingOptions(std::string_view s);

} // namespace Hls

#endif
