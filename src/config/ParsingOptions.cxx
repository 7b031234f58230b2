// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ParsingOptions.hxx"
#include "util/IterableSplitString.hxx"
#include "util/StringCompare.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

namespace Hls {

/**
 * Parse a tag name; accepts "#EXT-X-FOO", "EXT-X-FOO", "-X-FOO" and
 * "X-FOO".
 */
static TagName
ParseOptionName(std::string_view name)
{
	const std::string_view original = name;

	if (!SkipPrefix(name, TAG_MARKER))
		SkipPrefix(name, TAG_MARKER.substr(1));

	auto result = ParseTagName(name);
	if (result == TagName::UNKNOWN && !name.starts_with('-'))
		result = ParseTagName(fmt::format("-{}", name));

	if (result == TagName::UNKNOWN)
		throw std::invalid_argument(fmt::format("Unknown tag name '{}'",
							original));

	return result;
}

ParsingOptions
ParseParsingOptions(std::string_view s)
{
	s = Strip(s);

	TagNameMask mask = TagNameMask::All();

	if (!s.starts_with('+') && !s.starts_with('-'))
		/* no "+-": not incremental */
		mask = TagNameMask::None();

	bool first = true;
	for (std::string_view item : IterableSplitString(s, ',')) {
		item = Strip(item);

		if (first) {
			first = false;

			if (item == "none"sv)
				continue;

			if (item == "all"sv) {
				mask = TagNameMask::All();
				continue;
			}
		}

		if (item.empty())
			continue;

		bool plus = true;
		if (SkipPrefix(item, "+"sv))
			plus = true;
		else if (SkipPrefix(item, "-"sv))
			plus = false;

		const auto name = ParseOptionName(Strip(item));
		if (plus)
			mask.Set(name);
		else
			mask.Unset(name);
	}

	return ParsingOptions{mask};
}

} // namespace Hls
