// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "StreamInf.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

static constexpr std::string_view CLOSED_CAPTIONS_NONE = "NONE";

StreamInf::StreamInf(const ParsedTag &tag)
	:VariantStreamTag(tag.original_input, GetAttributeList(tag, NAME))
{
	const auto &list = GetAttributeList(tag);
	frame_rate.Found(list.Find("FRAME-RATE"));
	audio.Found(list.Find("AUDIO"));
	subtitles.Found(list.Find("SUBTITLES"));
	closed_captions.Found(list.Find("CLOSED-CAPTIONS"));
}

StreamInf::StreamInf(uint64_t _bandwidth)
	:VariantStreamTag(_bandwidth)
{
	InitOutputLine();
}

static std::optional<std::string_view>
GetClosedCaptionsValue(const AttributeValue &value) noexcept
{
	if (const auto s = GetQuotedString(value))
		return s;

	if (GetUnquotedString(value) == CLOSED_CAPTIONS_NONE)
		return CLOSED_CAPTIONS_NONE;

	return std::nullopt;
}

std::optional<std::string_view>
StreamInf::GetClosedCaptions() const noexcept
{
	return closed_captions.Get<std::string_view>(GetClosedCaptionsValue);
}

std::string
StreamInf::CalculateLine() const
{
	LineBuilder b{NAME};
	b.Integer("BANDWIDTH", GetBandwidth())
		.Integer("AVERAGE-BANDWIDTH", GetAverageBandwidth())
		.Float("SCORE", GetScore())
		.Quoted("CODECS", GetCodecs())
		.Quoted("SUPPLEMENTAL-CODECS", GetSupplementalCodecs());

	if (const auto r = GetResolution())
		b.Resolution("RESOLUTION", *r);

	b.Float("FRAME-RATE", GetFrameRate());

	if (const auto h = GetHdcpLevel())
		b.Unquoted("HDCP-LEVEL", h->AsString());

	b.Quoted("ALLOWED-CPC", GetAllowedCpc());

	if (const auto v = GetVideoRange())
		b.Unquoted("VIDEO-RANGE", v->AsString());

	b.Quoted("REQ-VIDEO-LAYOUT", GetReqVideoLayout())
		.Quoted("STABLE-VARIANT-ID", GetStableVariantId())
		.Quoted("AUDIO", GetAudio())
		.Quoted("VIDEO", GetVideo())
		.Quoted("SUBTITLES", GetSubtitles());

	if (const auto cc = GetClosedCaptions()) {
		if (*cc == CLOSED_CAPTIONS_NONE)
			b.Unquoted("CLOSED-CAPTIONS", *cc);
		else
			b.Quoted("CLOSED-CAPTIONS", *cc);
	}

	return b.Quoted("PATHWAY-ID", GetPathwayId()).Finish();
}

} // namespace Hls
