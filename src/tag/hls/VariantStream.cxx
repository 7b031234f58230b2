// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "VariantStream.hxx"
#include "tag/Extract.hxx"
#include "tag/Reinterpret.hxx"

namespace Hls {

VariantStreamTag::VariantStreamTag(std::string_view original_input,
				   const AttributeList &list)
	:DirtyLineTag(original_input),
	 bandwidth(RequireDecimalInteger(list, "BANDWIDTH"))
{
	average_bandwidth.Found(list.Find("AVERAGE-BANDWIDTH"));
	score.Found(list.Find("SCORE"));
	codecs.Found(list.Find("CODECS"));
	supplemental_codecs.Found(list.Find("SUPPLEMENTAL-CODECS"));
	resolution.Found(list.Find("RESOLUTION"));
	hdcp_level.Found(list.Find("HDCP-LEVEL"));
	allowed_cpc.Found(list.Find("ALLOWED-CPC"));
	video_range.Found(list.Find("VIDEO-RANGE"));
	req_video_layout.Found(list.Find("REQ-VIDEO-LAYOUT"));
	stable_variant_id.Found(list.Find("STABLE-VARIANT-ID"));
	video.Found(list.Find("VIDEO"));
	pathway_id.Found(list.Find("PATHWAY-ID"));
}

std::optional<EnumeratedString<HdcpLevel>>
VariantStreamTag::GetHdcpLevel() const noexcept
{
	return hdcp_level.Get<EnumeratedString<HdcpLevel>>(GetUnquotedEnumerated<HdcpLevel>);
}

std::optional<EnumeratedString<VideoRange>>
VariantStreamTag::GetVideoRange() const noexcept
{
	return video_range.Get<EnumeratedString<VideoRange>>(GetUnquotedEnumerated<VideoRange>);
}

} // namespace Hls
