// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Media.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"
#include "tag/Reinterpret.hxx"

namespace Hls {

Media::Media(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &list = GetAttributeList(tag);
	type = MaybeOwnedString{RequireUnquotedString(list, "TYPE")};
	name = MaybeOwnedString{RequireQuotedString(list, "NAME")};
	group_id = MaybeOwnedString{RequireQuotedString(list, "GROUP-ID")};

	uri.Found(list.Find("URI"));
	language.Found(list.Find("LANGUAGE"));
	assoc_language.Found(list.Find("ASSOC-LANGUAGE"));
	stable_rendition_id.Found(list.Find("STABLE-RENDITION-ID"));
	default_.Found(list.Find("DEFAULT"));
	autoselect.Found(list.Find("AUTOSELECT"));
	forced.Found(list.Find("FORCED"));
	instream_id.Found(list.Find("INSTREAM-ID"));
	bit_depth.Found(list.Find("BIT-DEPTH"));
	sample_rate.Found(list.Find("SAMPLE-RATE"));
	characteristics.Found(list.Find("CHARACTERISTICS"));
	channels.Found(list.Find("CHANNELS"));
}

Media::Media(EnumeratedString<MediaType> _type,
	     std::string _name, std::string _group_id)
	:type(std::string{_type.AsString()}),
	 name(std::move(_name)), group_id(std::move(_group_id))
{
	InitOutputLine();
}

std::optional<EnumeratedString<InstreamId>>
Media::GetInstreamId() const noexcept
{
	return instream_id.Get<EnumeratedString<InstreamId>>(GetQuotedEnumerated<InstreamId>);
}

std::optional<EnumeratedStringList<MediaCharacteristic>>
Media::GetCharacteristics() const noexcept
{
	return characteristics.Get<EnumeratedStringList<MediaCharacteristic>>(GetQuotedEnumeratedList<MediaCharacteristic>);
}

std::string
Media::CalculateLine() const
{
	LineBuilder b{NAME};
	b.Unquoted("TYPE", type.Get())
		.Quoted("NAME", name.Get())
		.Quoted("GROUP-ID", group_id.Get())
		.Quoted("URI", GetUri())
		.Quoted("LANGUAGE", GetLanguage())
		.Quoted("ASSOC-LANGUAGE", GetAssocLanguage())
		.Quoted("STABLE-RENDITION-ID", GetStableRenditionId())
		.YesFlag("DEFAULT", IsDefault())
		.YesFlag("AUTOSELECT", IsAutoselect())
		.YesFlag("FORCED", IsForced());

	if (const auto id = GetInstreamId())
		b.Quoted("INSTREAM-ID", id->AsString());

	b.Integer("BIT-DEPTH", GetBitDepth())
		.Integer("SAMPLE-RATE", GetSampleRate());

	if (const auto c = GetCharacteristics())
		b.Quoted("CHARACTERISTICS", c->AsString());

	return b.Quoted("CHANNELS", GetChannels()).Finish();
}

} // namespace Hls
