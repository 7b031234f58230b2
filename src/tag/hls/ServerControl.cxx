// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ServerControl.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

ServerControl::ServerControl(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &list = GetAttributeList(tag);
	can_skip_until.Found(list.Find("CAN-SKIP-UNTIL"));
	can_skip_dateranges.Found(list.Find("CAN-SKIP-DATERANGES"));
	hold_back.Found(list.Find("HOLD-BACK"));
	part_hold_back.Found(list.Find("PART-HOLD-BACK"));
	can_block_reload.Found(list.Find("CAN-BLOCK-RELOAD"));
}

ServerControl::ServerControl()
{
	InitOutputLine();
}

std::string
ServerControl::CalculateLine() const
{
	return LineBuilder{NAME}
		.Float("CAN-SKIP-UNTIL", GetCanSkipUntil())
		.YesFlag("CAN-SKIP-DATERANGES", CanSkipDateranges())
		.Float("HOLD-BACK", GetHoldBack())
		.Float("PART-HOLD-BACK", GetPartHoldBack())
		.YesFlag("CAN-BLOCK-RELOAD", CanBlockReload())
		.Finish();
}

} // namespace Hls
