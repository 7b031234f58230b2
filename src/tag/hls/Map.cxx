// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Map.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"
#include "tag/Reinterpret.hxx"

namespace Hls {

Map::Map(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &list = GetAttributeList(tag);
	uri = MaybeOwnedString{RequireQuotedString(list, "URI")};
	byterange.Found(list.Find("BYTERANGE"));
}

Map::Map(std::string _uri)
	:uri(std::move(_uri))
{
	InitOutputLine();
}

std::optional<DecimalIntegerRange>
Map::GetByterange() const noexcept
{
	auto range = byterange.Get(GetQuotedDecimalIntegerRange);
	if (range && !range->offset)
		range->offset = 0;
	return range;
}

std::string
Map::CalculateLine() const
{
	LineBuilder b{NAME};
	b.Quoted("URI", uri.Get());

	if (const auto range = GetByterange())
		b.Quoted("BYTERANGE",
			 std::string_view{FormatDecimalIntegerRange(*range)});

	return b.Finish();
}

} // namespace Hls
