// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Tag.hxx"
#include "ParsedTag.hxx"

#include <array>

namespace Hls {

template<std::size_t I>
static Tag
ConstructTag(const ParsedTag &tag)
{
	return Tag{std::in_place_index<I>, tag};
}

template<std::size_t... I>
static constexpr auto
MakeTagFactories(std::index_sequence<I...>) noexcept
{
	return std::array<Tag(*)(const ParsedTag &), sizeof...(I)>{
		&ConstructTag<I>...
	};
}

/**
 * A constructor function for each #TagName, indexed by it.
 */
static constexpr auto tag_factories =
	MakeTagFactories(std::make_index_sequence<NUM_TAG_NAMES>());

Tag
ParseKnownTag(TagName name, const ParsedTag &tag)
{
	return tag_factories[std::size_t(name)](tag);
}

} // namespace Hls
