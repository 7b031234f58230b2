// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_PARSED_TAG_HXX
#define HLS_PARSED_TAG_HXX

#include "value/TagValue.hxx"

#include <string_view>

namespace Hls {

/**
 * A tokenized tag line, not yet converted into a typed record.  All
 * strings point into the input.
 */
struct ParsedTag {
	/**
	 * The name after "#EXT", e.g. "-X-VERSION".
	 */
	std::string_view name;

	SemiParsedTagValue value;

	/**
	 * The complete line without the line terminator.
	 */
	std::string_view original_input;
};

} // namespace Hls

#endif
