// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_NAME_HXX
#define HLS_TAG_NAME_HXX

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Hls {

/**
 * The tag names this library has a typed record for.
 */
enum class TagName : uint8_t {
	M3U,
	VERSION,
	INDEPENDENT_SEGMENTS,
	START,
	DEFINE,
	TARGETDURATION,
	MEDIA_SEQUENCE,
	DISCONTINUITY_SEQUENCE,
	ENDLIST,
	PLAYLIST_TYPE,
	I_FRAMES_ONLY,
	PART_INF,
	SERVER_CONTROL,
	INF,
	BYTERANGE,
	DISCONTINUITY,
	KEY,
	MAP,
	PROGRAM_DATE_TIME,
	GAP,
	BITRATE,
	PART,
	DATERANGE,
	SKIP,
	PRELOAD_HINT,
	RENDITION_REPORT,
	MEDIA,
	STREAM_INF,
	I_FRAME_STREAM_INF,
	SESSION_DATA,
	SESSION_KEY,
	CONTENT_STEERING,

	/**
	 * Not a valid name; returned by ParseTagName() on mismatch.
	 */
	UNKNOWN,
};

static constexpr std::size_t NUM_TAG_NAMES = std::size_t(TagName::UNKNOWN);

/**
 * Where a tag may appear.
 */
enum class TagType : uint8_t {
	BASIC,
	MEDIA_OR_MULTIVARIANT_PLAYLIST,
	MEDIA_PLAYLIST,
	MEDIA_SEGMENT,
	MEDIA_METADATA,
	MULTIVARIANT_PLAYLIST,
};

/**
 * The line prefix which introduces a tag.
 */
static constexpr std::string_view TAG_MARKER = "#EXT";

/**
 * Parse the name which follows "#EXT" (e.g. "-X-VERSION").  Returns
 * TagName::UNKNOWN if the string could not be recognized.
 */
[[gnu::pure]]
TagName
ParseTagName(std::string_view name) noexcept;

/**
 * @return the name as it follows "#EXT", e.g. "-X-VERSION"
 */
[[gnu::const]]
std::string_view
GetTagNameString(TagName name) noexcept;

[[gnu::const]]
TagType
GetTagType(TagName name) noexcept;

} // namespace Hls

#endif
