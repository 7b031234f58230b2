// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_VARIANT_STREAM_HXX
#define HLS_TAG_VARIANT_STREAM_HXX

#include "Enumerations.hxx"
#include "tag/DirtyLineTag.hxx"
#include "tag/LazyAttribute.hxx"
#include "value/DecimalResolution.hxx"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Hls {

/**
 * The attributes shared by EXT-X-STREAM-INF and
 * EXT-X-I-FRAME-STREAM-INF.
 */
class VariantStreamTag : public DirtyLineTag {
	uint64_t bandwidth;
	LazyAttribute<uint64_t> average_bandwidth;
	LazyAttribute<double> score;
	LazyAttribute<std::string> codecs;
	LazyAttribute<std::string> supplemental_codecs;
	LazyAttribute<DecimalResolution> resolution;
	LazyAttribute<std::string> hdcp_level;
	LazyAttribute<std::string> allowed_cpc;
	LazyAttribute<std::string> video_range;
	LazyAttribute<std::string> req_video_layout;
	LazyAttribute<std::string> stable_variant_id;
	LazyAttribute<std::string> video;
	LazyAttribute<std::string> pathway_id;

protected:
	/**
	 * Throws #ValidationError on error.
	 */
	VariantStreamTag(std::string_view original_input,
			 const AttributeList &list);

	explicit VariantStreamTag(uint64_t _bandwidth) noexcept
		:bandwidth(_bandwidth) {}

public:
	uint64_t GetBandwidth() const noexcept {
		return bandwidth;
	}

	std::optional<uint64_t> GetAverageBandwidth() const noexcept {
		return average_bandwidth.Get(GetDecimalInteger);
	}

	std::optional<double> GetScore() const noexcept {
		return score.Get(GetDecimalFloat);
	}

	std::optional<std::string_view> GetCodecs() const noexcept {
		return codecs.Get<std::string_view>(GetQuotedString);
	}

	std::optional<std::string_view> GetSupplementalCodecs() const noexcept {
		return supplemental_codecs.Get<std::string_view>(GetQuotedString);
	}

	std::optional<DecimalResolution> GetResolution() const noexcept {
		return resolution.Get(GetDecimalResolution);
	}

	std::optional<EnumeratedString<HdcpLevel>> GetHdcpLevel() const noexcept;

	std::optional<std::string_view> GetAllowedCpc() const noexcept {
		return allowed_cpc.Get<std::string_view>(GetQuotedString);
	}

	std::optional<EnumeratedString<VideoRange>> GetVideoRange() const noexcept;

	std::optional<std::string_view> GetReqVideoLayout() const noexcept {
		return req_video_layout.Get<std::string_view>(GetQuotedString);
	}

	std::optional<std::string_view> GetStableVariantId() const noexcept {
		return stable_variant_id.Get<std::string_view>(GetQuotedString);
	}

	std::optional<std::string_view> GetVideo() const noexcept {
		return video.Get<std::string_view>(GetQuotedString);
	}

	std::optional<std::string_view> GetPathwayId() const noexcept {
		return pathway_id.Get<std::string_view>(GetQuotedString);
	}

	void SetBandwidth(uint64_t value) noexcept {
		bandwidth = value;
		MarkDirty();
	}

	void SetAverageBandwidth(uint64_t value) noexcept {
		average_bandwidth.Set(value);
		MarkDirty();
	}

	void UnsetAverageBandwidth() noexcept {
		average_bandwidth.Unset();
		MarkDirty();
	}

	void SetScore(double value) noexcept {
		score.Set(value);
		MarkDirty();
	}

	void UnsetScore() noexcept {
		score.Unset();
		MarkDirty();
	}

	void SetCodecs(std::string value) noexcept {
		codecs.Set(std::move(value));
		MarkDirty();
	}

	void UnsetCodecs() noexcept {
		codecs.Unset();
		MarkDirty();
	}

	void SetSupplementalCodecs(std::string value) noexcept {
		supplemental_codecs.Set(std::move(value));
		MarkDirty();
	}

	void UnsetSupplementalCodecs() noexcept {
		supplemental_codecs.Unset();
		MarkDirty();
	}

	void SetResolution(DecimalResolution value) noexcept {
		resolution.Set(value);
		MarkDirty();
	}

	void UnsetResolution() noexcept {
		resolution.Unset();
		MarkDirty();
	}

	void SetHdcpLevel(EnumeratedString<HdcpLevel> value) {
		hdcp_level.Set(std::string{value.AsString()});
		MarkDirty();
	}

	void UnsetHdcpLevel() noexcept {
		hdcp_level.Unset();
		MarkDirty();
	}

	void SetAllowedCpc(std::string value) noexcept {
		allowed_cpc.Set(std::move(value));
		MarkDirty();
	}

	void UnsetAllowedCpc() noexcept {
		allowed_cpc.Unset();
		MarkDirty();
	}

	void SetVideoRange(EnumeratedString<VideoRange> value) {
		video_range.Set(std::string{value.AsString()});
		MarkDirty();
	}

	void UnsetVideoRange() noexcept {
		video_range.Unset();
		MarkDirty();
	}

	void SetReqVideoLayout(std::string value) noexcept {
		req_video_layout.Set(std::move(value));
		MarkDirty();
	}

	void UnsetReqVideoLayout() noexcept {
		req_video_layout.Unset();
		MarkDirty();
	}

	void SetStableVariantId(std::string value) noexcept {
		stable_variant_id.Set(std::move(value));
		MarkDirty();
	}

	void UnsetStableVariantId() noexcept {
		stable_variant_id.Unset();
		MarkDirty();
	}

	void SetVideo(std::string value) noexcept {
		video.Set(std::move(value));
		MarkDirty();
	}

	void UnsetVideo() noexcept {
		video.Unset();
		MarkDirty();
	}

	void SetPathwayId(std::string value) noexcept {
		pathway_id.Set(std::move(value));
		MarkDirty();
	}

	void UnsetPathwayId() noexcept {
		pathway_id.Unset();
		MarkDirty();
	}
};

} // namespace Hls

#endif
