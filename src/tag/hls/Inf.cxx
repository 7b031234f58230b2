// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Inf.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

Inf::Inf(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	if (const auto *v = std::get_if<FloatWithTitle>(&tag.value)) {
		duration = v->number;
		title = MaybeOwnedString{v->title};
	} else if (const auto *u = std::get_if<UnparsedValue>(&tag.value)) {
		/* the comma is mandatory, but be lenient */
		duration = ExtractTagValue([u]{
			return u->AsDecimalFloatingPoint();
		});
	} else
		throw ValidationError::UnexpectedValueType("duration with title");
}

Inf::Inf(double _duration, std::string _title)
	:duration(_duration), title(std::move(_title))
{
	InitOutputLine();
}

std::string
Inf::CalculateLine() const
{
	return LineBuilder{NAME}
		.FormatValue("{},{}", FormatDecimalFloat(duration), title.Get())
		.Finish();
}

} // namespace Hls
