// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "RenditionReport.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

RenditionReport::RenditionReport(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &list = GetAttributeList(tag);
	uri = MaybeOwnedString{RequireQuotedString(list, "URI")};
	last_msn = RequireDecimalInteger(list, "LAST-MSN");
	last_part.Found(list.Find("LAST-PART"));
}

RenditionReport::RenditionReport(std::string _uri, uint64_t _last_msn)
	:uri(std::move(_uri)), last_msn(_last_msn)
{
	InitOutputLine();
}

std::string
RenditionReport::CalculateLine() const
{
	return LineBuilder{NAME}
		.Quoted("URI", uri.Get())
		.Integer("LAST-MSN", last_msn)
		.Integer("LAST-PART", GetLastPart())
		.Finish();
}

} // namespace Hls
