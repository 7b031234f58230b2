// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Start.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

Start::Start(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &list = GetAttributeList(tag);
	time_offset = RequireDecimalFloat(list, "TIME-OFFSET");
	precise.Found(list.Find("PRECISE"));
}

Start::Start(double _time_offset, bool _precise)
	:time_offset(_time_offset)
{
	precise.Set(_precise);
	InitOutputLine();
}

std::string
Start::CalculateLine() const
{
	return LineBuilder{NAME}
		.Float("TIME-OFFSET", time_offset)
		.YesFlag("PRECISE", IsPrecise())
		.Finish();
}

} // namespace Hls
