// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_STREAM_INF_HXX
#define HLS_TAG_STREAM_INF_HXX

#include "VariantStream.hxx"
#include "tag/TagName.hxx"

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-STREAM-INF; the URI of the variant stream is on the
 * following line.
 */
class StreamInf final : public VariantStreamTag {
	LazyAttribute<double> frame_rate;
	LazyAttribute<std::string> audio;
	LazyAttribute<std::string> subtitles;
	LazyAttribute<std::string> closed_captions;

public:
	static constexpr TagName NAME = TagName::STREAM_INF;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit StreamInf(const ParsedTag &tag);

	explicit StreamInf(uint64_t _bandwidth);

	std::optional<double> GetFrameRate() const noexcept {
		return frame_rate.Get(GetDecimalFloat);
	}

	std::optional<std::string_view> GetAudio() const noexcept {
		return audio.Get<std::string_view>(GetQuotedString);
	}

	std::optional<std::string_view> GetSubtitles() const noexcept {
		return subtitles.Get<std::string_view>(GetQuotedString);
	}

	/**
	 * The GROUP-ID of the closed captions, or "NONE" (which is
	 * written without quotes).
	 */
	std::optional<std::string_view> GetClosedCaptions() const noexcept;

	void SetFrameRate(double value) noexcept {
		frame_rate.Set(value);
		MarkDirty();
	}

	void UnsetFrameRate() noexcept {
		frame_rate.Unset();
		MarkDirty();
	}

	void SetAudio(std::string value) noexcept {
		audio.Set(std::move(value));
		MarkDirty();
	}

	void UnsetAudio() noexcept {
		audio.Unset();
		MarkDirty();
	}

	void SetSubtitles(std::string value) noexcept {
		subtitles.Set(std::move(value));
		MarkDirty();
	}

	void UnsetSubtitles() noexcept {
		subtitles.Unset();
		MarkDirty();
	}

	void SetClosedCaptions(std::string value) noexcept {
		closed_captions.Set(std::move(value));
		MarkDirty();
	}

	void UnsetClosedCaptions() noexcept {
		closed_captions.Unset();
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
