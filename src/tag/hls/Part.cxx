// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Part.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"
#include "tag/Reinterpret.hxx"

namespace Hls {

Part::Part(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &list = GetAttributeList(tag);
	uri = MaybeOwnedString{RequireQuotedString(list, "URI")};
	duration = RequireDecimalFloat(list, "DURATION");
	independent.Found(list.Find("INDEPENDENT"));
	byterange.Found(list.Find("BYTERANGE"));
	gap.Found(list.Find("GAP"));
}

Part::Part(std::string _uri, double _duration)
	:uri(std::move(_uri)), duration(_duration)
{
	InitOutputLine();
}

std::optional<DecimalIntegerRange>
Part::GetByterange() const noexcept
{
	return byterange.Get(GetQuotedDecimalIntegerRange);
}

std::string
Part::CalculateLine() const
{
	LineBuilder b{NAME};
	b.Quoted("URI", uri.Get())
		.Float("DURATION", duration)
		.YesFlag("INDEPENDENT", IsIndependent());

	if (const auto range = GetByterange())
		b.Quoted("BYTERANGE",
			 std::string_view{FormatDecimalIntegerRange(*range)});

	return b.YesFlag("GAP", IsGap()).Finish();
}

} // namespace Hls
