// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_EMPTY_HXX
#define HLS_TAG_EMPTY_HXX

#include "tag/DirtyLineTag.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

#include <variant>

namespace Hls {

/**
 * A tag without a value, e.g. EXTM3U or EXT-X-ENDLIST.
 */
template<TagName N>
class EmptyTag final : public DirtyLineTag {
public:
	static constexpr TagName NAME = N;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit EmptyTag(const ParsedTag &tag)
		:DirtyLineTag(tag.original_input)
	{
		CheckTagName(tag, NAME);

		if (!std::holds_alternative<EmptyValue>(tag.value))
			throw ValidationError::UnexpectedValueType("empty value");
	}

	EmptyTag() {
		InitOutputLine();
	}

protected:
	std::string CalculateLine() const override {
		return LineBuilder{NAME}.Finish();
	}
};

using M3u = EmptyTag<TagName::M3U>;
using IndependentSegments = EmptyTag<TagName::INDEPENDENT_SEGMENTS>;
using Endlist = EmptyTag<TagName::ENDLIST>;
using IFramesOnly = EmptyTag<TagName::I_FRAMES_ONLY>;
using Discontinuity = EmptyTag<TagName::DISCONTINUITY>;
using Gap = EmptyTag<TagName::GAP>;

} // namespace Hls

#endif
