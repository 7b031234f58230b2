// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Skip.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

Skip::Skip(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &list = GetAttributeList(tag);
	skipped_segments = RequireDecimalInteger(list, "SKIPPED-SEGMENTS");
	recently_removed_dateranges.Found(list.Find("RECENTLY-REMOVED-DATERANGES"));
}

Skip::Skip(uint64_t _skipped_segments)
	:skipped_segments(_skipped_segments)
{
	InitOutputLine();
}

std::string
Skip::CalculateLine() const
{
	return LineBuilder{NAME}
		.Integer("SKIPPED-SEGMENTS", skipped_segments)
		.Quoted("RECENTLY-REMOVED-DATERANGES",
			GetRecentlyRemovedDateranges())
		.Finish();
}

} // namespace Hls
