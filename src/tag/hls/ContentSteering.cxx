// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ContentSteering.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

ContentSteering::ContentSteering(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &list = GetAttributeList(tag);
	server_uri = MaybeOwnedString{RequireQuotedString(list, "SERVER-URI")};
	pathway_id.Found(list.Find("PATHWAY-ID"));
}

ContentSteering::ContentSteering(std::string _server_uri)
	:server_uri(std::move(_server_uri))
{
	InitOutputLine();
}

std::string
ContentSteering::CalculateLine() const
{
	return LineBuilder{NAME}
		.Quoted("SERVER-URI", server_uri.Get())
		.Quoted("PATHWAY-ID", GetPathwayId())
		.Finish();
}

} // namespace Hls
