// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_PART_INF_HXX
#define HLS_TAG_PART_INF_HXX

#include "tag/DirtyLineTag.hxx"
#include "tag/TagName.hxx"

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-PART-INF
 */
class PartInf final : public DirtyLineTag {
	double part_target;

public:
	static constexpr TagName NAME = TagName::PART_INF;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit PartInf(const ParsedTag &tag);

	explicit PartInf(double _part_target);

	double GetPartTarget() const noexcept {
		return part_target;
	}

	void SetPartTarget(double _part_target) noexcept {
		part_target = _part_target;
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
