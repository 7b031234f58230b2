// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_INTEGER_HXX
#define HLS_TAG_INTEGER_HXX

#include "tag/DirtyLineTag.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

#include <cstdint>

namespace Hls {

/**
 * A tag whose value is one decimal integer, e.g. EXT-X-VERSION or
 * EXT-X-TARGETDURATION.
 */
template<TagName N>
class IntegerTag final : public DirtyLineTag {
	uint64_t value;

public:
	static constexpr TagName NAME = N;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit IntegerTag(const ParsedTag &tag)
		:DirtyLineTag(tag.original_input)
	{
		CheckTagName(tag, NAME);

		const auto &unparsed = GetUnparsedValue(tag);
		value = ExtractTagValue([&unparsed]{
			return unparsed.AsDecimalInteger();
		});
	}

	explicit IntegerTag(uint64_t _value)
		:value(_value)
	{
		InitOutputLine();
	}

	uint64_t GetValue() const noexcept {
		return value;
	}

	void SetValue(uint64_t _value) noexcept {
		value = _value;
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override {
		return LineBuilder{NAME}.FormatValue("{}", value).Finish();
	}
};

using Version = IntegerTag<TagName::VERSION>;
using Targetduration = IntegerTag<TagName::TARGETDURATION>;
using MediaSequence = IntegerTag<TagName::MEDIA_SEQUENCE>;
using DiscontinuitySequence = IntegerTag<TagName::DISCONTINUITY_SEQUENCE>;
using Bitrate = IntegerTag<TagName::BITRATE>;

} // namespace Hls

#endif
