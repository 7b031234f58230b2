// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Byterange.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

Byterange::Byterange(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &unparsed = GetUnparsedValue(tag);
	const auto range = ExtractTagValue([&unparsed]{
		return unparsed.AsDecimalIntegerRange();
	});

	length = range.length;
	offset = range.offset;
}

Byterange::Byterange(uint64_t _length, std::optional<uint64_t> _offset)
	:length(_length), offset(_offset)
{
	InitOutputLine();
}

std::string
Byterange::CalculateLine() const
{
	return LineBuilder{NAME}
		.Value(FormatDecimalIntegerRange({length, offset}))
		.Finish();
}

} // namespace Hls
