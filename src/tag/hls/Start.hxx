// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_START_HXX
#define HLS_TAG_START_HXX

#include "tag/DirtyLineTag.hxx"
#include "tag/LazyAttribute.hxx"
#include "tag/TagName.hxx"

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-START
 */
class Start final : public DirtyLineTag {
	double time_offset;
	LazyAttribute<bool> precise;

public:
	static constexpr TagName NAME = TagName::START;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit Start(const ParsedTag &tag);

	explicit Start(double _time_offset, bool _precise=false);

	double GetTimeOffset() const noexcept {
		return time_offset;
	}

	bool IsPrecise() const noexcept {
		return precise.Get(GetYesNo).value_or(false);
	}

	void SetTimeOffset(double _time_offset) noexcept {
		time_offset = _time_offset;
		MarkDirty();
	}

	void SetPrecise(bool _precise) noexcept {
		precise.Set(_precise);
		MarkDirty();
	}

	void UnsetPrecise() noexcept {
		precise.Unset();
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
