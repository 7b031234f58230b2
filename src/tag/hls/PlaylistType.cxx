// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "PlaylistType.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

PlaylistType::PlaylistType(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &unparsed = GetUnparsedValue(tag);
	type = ExtractTagValue([&unparsed]{
		return unparsed.AsPlaylistType();
	});
}

PlaylistType::PlaylistType(PlaylistTypeValue _type)
	:type(_type)
{
	InitOutputLine();
}

std::string
PlaylistType::CalculateLine() const
{
	return LineBuilder{NAME}.Value(GetPlaylistTypeString(type)).Finish();
}

} // namespace Hls
