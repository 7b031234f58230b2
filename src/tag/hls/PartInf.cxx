// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "PartInf.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

PartInf::PartInf(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	part_target = RequireDecimalFloat(GetAttributeList(tag), "PART-TARGET");
}

PartInf::PartInf(double _part_target)
	:part_target(_part_target)
{
	InitOutputLine();
}

std::string
PartInf::CalculateLine() const
{
	return LineBuilder{NAME}.Float("PART-TARGET", part_target).Finish();
}

} // namespace Hls
