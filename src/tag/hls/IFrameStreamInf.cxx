// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "IFrameStreamInf.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

IFrameStreamInf::IFrameStreamInf(const ParsedTag &tag)
	:VariantStreamTag(tag.original_input, GetAttributeList(tag, NAME)),
	 uri(RequireQuotedString(GetAttributeList(tag), "URI"))
{
}

IFrameStreamInf::IFrameStreamInf(std::string _uri, uint64_t _bandwidth)
	:VariantStreamTag(_bandwidth), uri(std::move(_uri))
{
	InitOutputLine();
}

std::string
IFrameStreamInf::CalculateLine() const
{
	LineBuilder b{NAME};
	b.Quoted("URI", uri.Get())
		.Integer("BANDWIDTH", GetBandwidth())
		.Integer("AVERAGE-BANDWIDTH", GetAverageBandwidth())
		.Float("SCORE", GetScore())
		.Quoted("CODECS", GetCodecs())
		.Quoted("SUPPLEMENTAL-CODECS", GetSupplementalCodecs());

	if (const auto r = GetResolution())
		b.Resolution("RESOLUTION", *r);

	if (const auto h = GetHdcpLevel())
		b.Unquoted("HDCP-LEVEL", h->AsString());

	b.Quoted("ALLOWED-CPC", GetAllowedCpc());

	if (const auto v = GetVideoRange())
		b.Unquoted("VIDEO-RANGE", v->AsString());

	return b.Quoted("REQ-VIDEO-LAYOUT", GetReqVideoLayout())
		.Quoted("STABLE-VARIANT-ID", GetStableVariantId())
		.Quoted("VIDEO", GetVideo())
		.Quoted("PATHWAY-ID", GetPathwayId())
		.Finish();
}

} // namespace Hls
