// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Key.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

Key::Key(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &list = GetAttributeList(tag);
	method = MaybeOwnedString{RequireUnquotedString(list, "METHOD")};
	uri.Found(list.Find("URI"));
	iv.Found(list.Find("IV"));
	keyformat.Found(list.Find("KEYFORMAT"));
	keyformatversions.Found(list.Find("KEYFORMATVERSIONS"));
}

Key::Key(EnumeratedString<KeyMethod> _method)
	:method(std::string{_method.AsString()})
{
	InitOutputLine();
}

std::string
Key::CalculateLine() const
{
	LineBuilder b{NAME};
	b.Unquoted("METHOD", method.Get())
		.Quoted("URI", GetUri())
		.Unquoted("IV", GetIv());

	if (const auto k = GetKeyformat(); k != DEFAULT_KEYFORMAT)
		b.Quoted("KEYFORMAT", k);

	return b.Quoted("KEYFORMATVERSIONS", GetKeyformatversions())
		.Finish();
}

} // namespace Hls
