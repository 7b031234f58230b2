// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_PART_HXX
#define HLS_TAG_PART_HXX

#include "tag/DirtyLineTag.hxx"
#include "tag/LazyAttribute.hxx"
#include "tag/MaybeOwnedString.hxx"
#include "tag/TagName.hxx"
#include "value/TagValue.hxx"

#include <optional>
#include <string>
#include <string_view>

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-PART
 */
class Part final : public DirtyLineTag {
	MaybeOwnedString uri;
	double duration;
	LazyAttribute<bool> independent;
	LazyAttribute<DecimalIntegerRange> byterange;
	LazyAttribute<bool> gap;

public:
	static constexpr TagName NAME = TagName::PART;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit Part(const ParsedTag &tag);

	Part(std::string _uri, double _duration);

	std::string_view GetUri() const noexcept {
		return uri.Get();
	}

	double GetDuration() const noexcept {
		return duration;
	}

	bool IsIndependent() const noexcept {
		return independent.Get(GetYesNo).value_or(false);
	}

	std::optional<DecimalIntegerRange> GetByterange() const noexcept;

	bool IsGap() const noexcept {
		return gap.Get(GetYesNo).value_or(false);
	}

	void SetUri(std::string value) noexcept {
		uri = MaybeOwnedString{std::move(value)};
		MarkDirty();
	}

	void SetDuration(double value) noexcept {
		duration = value;
		MarkDirty();
	}

	void SetIndependent(bool value) noexcept {
		independent.Set(value);
		MarkDirty();
	}

	void UnsetIndependent() noexcept {
		independent.Unset();
		MarkDirty();
	}

	void SetByterange(DecimalIntegerRange value) noexcept {
		byterange.Set(value);
		MarkDirty();
	}

	void UnsetByterange() noexcept {
		byterange.Unset();
		MarkDirty();
	}

	void SetGap(bool value) noexcept {
		gap.Set(value);
		MarkDirty();
	}

	void UnsetGap() noexcept {
		gap.Unset();
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
