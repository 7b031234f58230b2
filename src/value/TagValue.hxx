// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_VALUE_HXX
#define HLS_TAG_VALUE_HXX

#include "AttributeValue.hxx"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace Hls {

struct DateTime;

enum class PlaylistTypeValue {
	VOD,
	EVENT,
};

[[gnu::const]]
std::string_view
GetPlaylistTypeString(PlaylistTypeValue type) noexcept;

/**
 * A "<n>[@<o>]" pair as used by EXT-X-BYTERANGE.
 */
struct DecimalIntegerRange {
	uint64_t length;
	std::optional<uint64_t> offset;

	bool operator==(const DecimalIntegerRange &) const noexcept = default;
};

/**
 * Render "<n>[@<o>]".
 */
std::string
FormatDecimalIntegerRange(const DecimalIntegerRange &range);

/**
 * Render a decimal-floating-point value: the shortest digits which
 * parse back to the same value, never in exponent notation, without
 * trailing zeros (10.0 renders as "10").
 */
std::string
FormatDecimalFloat(double value);

/**
 * The tag had no value.
 */
struct EmptyValue {
	bool operator==(const EmptyValue &) const noexcept = default;
};

/**
 * A number followed by an optional title, e.g. the value of
 * EXTINF.
 */
struct FloatWithTitle {
	double number;

	/**
	 * Everything after the comma, exactly as given; empty if there
	 * was no title.
	 */
	std::string_view title;

	bool operator==(const FloatWithTitle &) const noexcept = default;
};

/**
 * A value which the tokenizer alone cannot interpret; its meaning
 * depends on the tag it belongs to.  The line terminator is never
 * part of it.
 */
struct UnparsedValue {
	std::string_view value;

	bool operator==(const UnparsedValue &) const noexcept = default;

	/**
	 * Throws std::invalid_argument on error.
	 */
	uint64_t AsDecimalInteger() const;

	/**
	 * Throws std::invalid_argument on error.
	 */
	DecimalIntegerRange AsDecimalIntegerRange() const;

	/**
	 * Throws std::invalid_argument on error.
	 */
	PlaylistTypeValue AsPlaylistType() const;

	/**
	 * Throws #SyntaxError on error.
	 */
	double AsDecimalFloatingPoint() const;

	/**
	 * Throws #SyntaxError on error.
	 */
	DateTime AsDateTime() const;
};

/**
 * The result of tokenizing a tag value.
 */
using SemiParsedTagValue = std::variant<EmptyValue, FloatWithTitle,
					AttributeList, UnparsedValue>;

struct ClassifyResult {
	SemiParsedTagValue value;

	/**
	 * The input after the line terminator; std::nullopt if the
	 * input ended without one.
	 */
	std::optional<std::string_view> remaining;
};

/**
 * Tokenize the value of a tag; the input begins right after the
 * colon and may extend beyond the end of the line.
 *
 * Throws #SyntaxError on error.
 */
ClassifyResult
ClassifyTagValue(std::string_view input);

struct AttributeValueResult {
	AttributeValue value;

	/**
	 * The input after the value and its delimiter; std::nullopt
	 * if the input ended.
	 */
	std::optional<std::string_view> remaining;

	/**
	 * Was the value followed by a comma?
	 */
	bool more;
};

/**
 * Tokenize one attribute value; the input begins right after the
 * equals sign.
 *
 * Throws #SyntaxError on error.
 */
AttributeValueResult
ParseOneAttributeValue(std::string_view input);

} // namespace Hls

#endif
