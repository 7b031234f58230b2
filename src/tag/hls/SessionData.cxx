// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SessionData.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

SessionData::SessionData(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &list = GetAttributeList(tag);
	data_id = MaybeOwnedString{RequireQuotedString(list, "DATA-ID")};
	value.Found(list.Find("VALUE"));
	uri.Found(list.Find("URI"));
	format.Found(list.Find("FORMAT"));
	language.Found(list.Find("LANGUAGE"));
}

SessionData::SessionData(std::string _data_id)
	:data_id(std::move(_data_id))
{
	InitOutputLine();
}

std::string
SessionData::CalculateLine() const
{
	LineBuilder b{NAME};
	b.Quoted("DATA-ID", data_id.Get())
		.Quoted("VALUE", GetValue())
		.Quoted("URI", GetUri());

	if (const auto f = GetFormat(); f != SessionDataFormat::JSON)
		b.Unquoted("FORMAT", f.AsString());

	return b.Quoted("LANGUAGE", GetLanguage()).Finish();
}

} // namespace Hls
