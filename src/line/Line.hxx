// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_LINE_HXX
#define HLS_LINE_HXX

#include "tag/CustomTag.hxx"
#include "tag/Tag.hxx"
#include "tag/UnknownTag.hxx"

#include <optional>
#include <string_view>
#include <variant>

namespace Hls {

class ParsingOptions;
class CustomTagProvider;

/**
 * A line starting with "#" which is not a tag.
 */
struct CommentLine {
	/**
	 * The text after the "#".
	 */
	std::string_view text;
};

/**
 * A line which is not a tag or comment: the URI of a media segment
 * or of a variant playlist.
 */
struct UriLine {
	std::string_view uri;
};

struct BlankLine {};

/**
 * One line of a playlist.  Everything refers to the input buffer,
 * which must outlive this object (unless the tag records are
 * modified).
 */
using HlsLine = std::variant<Tag, CustomTagAccess, UnknownTag,
			     CommentLine, UriLine, BlankLine>;

struct ParseLineResult {
	HlsLine line;

	/**
	 * The input after the line terminator; std::nullopt if the
	 * input ended.
	 */
	std::optional<std::string_view> remaining;
};

/**
 * Parse the first line of the given input.  A tag whose name is
 * claimed by the #CustomTagProvider or is an enabled built-in name is
 * converted to a record; if that fails, the tag is returned as
 * #UnknownTag carrying the #ValidationError.
 *
 * Throws #SyntaxError if the line is malformed.
 *
 * @param input the input buffer; may contain more lines
 * @param custom an optional provider of application tag types
 */
ParseLineResult
ParseLine(std::string_view input, const ParsingOptions &options,
	  const CustomTagProvider *custom=nullptr);

} // namespace Hls

#endif
