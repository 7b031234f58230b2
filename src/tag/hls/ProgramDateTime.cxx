// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ProgramDateTime.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

ProgramDateTime::ProgramDateTime(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &unparsed = GetUnparsedValue(tag);
	date_time = ExtractTagValue([&unparsed]{
		return unparsed.AsDateTime();
	});
}

ProgramDateTime::ProgramDateTime(const DateTime &_date_time)
	:date_time(_date_time)
{
	InitOutputLine();
}

std::string
ProgramDateTime::CalculateLine() const
{
	return LineBuilder{NAME}.Value(FormatDateTime(date_time)).Finish();
}

} // namespace Hls
