// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "TagName.hxx"

#include <cassert>
#include <iterator>

namespace Hls {

static constexpr struct {
	TagName name;
	std::string_view string;
	TagType type;
} tag_name_table[] = {
	{TagName::M3U, "M3U", TagType::BASIC},
	{TagName::VERSION, "-X-VERSION", TagType::BASIC},
	{TagName::INDEPENDENT_SEGMENTS, "-X-INDEPENDENT-SEGMENTS", TagType::MEDIA_OR_MULTIVARIANT_PLAYLIST},
	{TagName::START, "-X-START", TagType::MEDIA_OR_MULTIVARIANT_PLAYLIST},
	{TagName::DEFINE, "-X-DEFINE", TagType::MEDIA_OR_MULTIVARIANT_PLAYLIST},
	{TagName::TARGETDURATION, "-X-TARGETDURATION", TagType::MEDIA_PLAYLIST},
	{TagName::MEDIA_SEQUENCE, "-X-MEDIA-SEQUENCE", TagType::MEDIA_PLAYLIST},
	{TagName::DISCONTINUITY_SEQUENCE, "-X-DISCONTINUITY-SEQUENCE", TagType::MEDIA_PLAYLIST},
	{TagName::ENDLIST, "-X-ENDLIST", TagType::MEDIA_PLAYLIST},
	{TagName::PLAYLIST_TYPE, "-X-PLAYLIST-TYPE", TagType::MEDIA_PLAYLIST},
	{TagName::I_FRAMES_ONLY, "-X-I-FRAMES-ONLY", TagType::MEDIA_PLAYLIST},
	{TagName::PART_INF, "-X-PART-INF", TagType::MEDIA_PLAYLIST},
	{TagName::SERVER_CONTROL, "-X-SERVER-CONTROL", TagType::MEDIA_PLAYLIST},
	{TagName::INF, "INF", TagType::MEDIA_SEGMENT},
	{TagName::BYTERANGE, "-X-BYTERANGE", TagType::MEDIA_SEGMENT},
	{TagName::DISCONTINUITY, "-X-DISCONTINUITY", TagType::MEDIA_SEGMENT},
	{TagName::KEY, "-X-KEY", TagType::MEDIA_SEGMENT},
	{TagName::MAP, "-X-MAP", TagType::MEDIA_SEGMENT},
	{TagName::PROGRAM_DATE_TIME, "-X-PROGRAM-DATE-TIME", TagType::MEDIA_SEGMENT},
	{TagName::GAP, "-X-GAP", TagType::MEDIA_SEGMENT},
	{TagName::BITRATE, "-X-BITRATE", TagType::MEDIA_SEGMENT},
	{TagName::PART, "-X-PART", TagType::MEDIA_SEGMENT},
	{TagName::DATERANGE, "-X-DATERANGE", TagType::MEDIA_METADATA},
	{TagName::SKIP, "-X-SKIP", TagType::MEDIA_METADATA},
	{TagName::PRELOAD_HINT, "-X-PRELOAD-HINT", TagType::MEDIA_METADATA},
	{TagName::RENDITION_REPORT, "-X-RENDITION-REPORT", TagType::MEDIA_METADATA},
	{TagName::MEDIA, "-X-MEDIA", TagType::MULTIVARIANT_PLAYLIST},
	{TagName::STREAM_INF, "-X-STREAM-INF", TagType::MULTIVARIANT_PLAYLIST},
	{TagName::I_FRAME_STREAM_INF, "-X-I-FRAME-STREAM-INF", TagType::MULTIVARIANT_PLAYLIST},
	{TagName::SESSION_DATA, "-X-SESSION-DATA", TagType::MULTIVARIANT_PLAYLIST},
	{TagName::SESSION_KEY, "-X-SESSION-KEY", TagType::MULTIVARIANT_PLAYLIST},
	{TagName::CONTENT_STEERING, "-X-CONTENT-STEERING", TagType::MULTIVARIANT_PLAYLIST},
};

static_assert(std::size(tag_name_table) == NUM_TAG_NAMES);

static constexpr bool
IsTableSorted() noexcept
{
	for (std::size_t i = 0; i < NUM_TAG_NAMES; ++i)
		if (tag_name_table[i].name != TagName(i))
			return false;
	return true;
}

static_assert(IsTableSorted(), "tag_name_table must be indexed by TagName");

TagName
ParseTagName(std::string_view name) noexcept
{
	for (const auto &i : tag_name_table)
		if (name == i.string)
			return i.name;

	return TagName::UNKNOWN;
}

std::string_view
GetTagNameString(TagName name) noexcept
{
	assert(std::size_t(name) < NUM_TAG_NAMES);

	return tag_name_table[std::size_t(name)].string;
}

TagType
GetTagType(TagName name) noexcept
{
	assert(std::size_t(name) < NUM_TAG_NAMES);

	return tag_name_table[std::size_t(name)].type;
}

} // namespace Hls
