// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CustomTag.hxx"
#include "ValidationError.hxx"

namespace Hls {

std::unique_ptr<CustomTag>
CustomTagProvider::Parse(const ParsedTag &) const
{
	throw ValidationError::NotImplemented();
}

std::string
CustomTagAccess::CalculateLine() const
{
	return CalculateOutput(tag->ToWritableTag());
}

} // namespace Hls
