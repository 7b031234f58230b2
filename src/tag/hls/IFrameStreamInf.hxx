// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_I_FRAME_STREAM_INF_HXX
#define HLS_TAG_I_FRAME_STREAM_INF_HXX

#include "VariantStream.hxx"
#include "tag/MaybeOwnedString.hxx"
#include "tag/TagName.hxx"

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-I-FRAME-STREAM-INF
 */
class IFrameStreamInf final : public VariantStreamTag {
	MaybeOwnedString uri;

public:
	static constexpr TagName NAME = TagName::I_FRAME_STREAM_INF;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit IFrameStreamInf(const ParsedTag &tag);

	IFrameStreamInf(std::string _uri, uint64_t _bandwidth);

	std::string_view GetUri() const noexcept {
		return uri.Get();
	}

	void SetUri(std::string value) noexcept {
		uri = MaybeOwnedString{std::move(value)};
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
