// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "PreloadHint.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

PreloadHint::PreloadHint(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &list = GetAttributeList(tag);
	type = MaybeOwnedString{RequireUnquotedString(list, "TYPE")};
	uri = MaybeOwnedString{RequireQuotedString(list, "URI")};
	byterange_start.Found(list.Find("BYTERANGE-START"));
	byterange_length.Found(list.Find("BYTERANGE-LENGTH"));
}

PreloadHint::PreloadHint(EnumeratedString<PreloadHintType> _type,
			 std::string _uri)
	:type(std::string{_type.AsString()}), uri(std::move(_uri))
{
	InitOutputLine();
}

std::string
PreloadHint::CalculateLine() const
{
	LineBuilder b{NAME};
	b.Unquoted("TYPE", type.Get())
		.Quoted("URI", uri.Get());

	/* the default start is not written */
	if (const auto start = GetByterangeStart(); start != 0)
		b.Integer("BYTERANGE-START", start);

	return b.Integer("BYTERANGE-LENGTH", GetByterangeLength())
		.Finish();
}

} // namespace Hls
