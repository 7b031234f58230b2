// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SessionKey.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

SessionKey::SessionKey(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &list = GetAttributeList(tag);
	method = MaybeOwnedString{RequireUnquotedString(list, "METHOD")};
	uri = MaybeOwnedString{RequireQuotedString(list, "URI")};
	iv.Found(list.Find("IV"));
	keyformat.Found(list.Find("KEYFORMAT"));
	keyformatversions.Found(list.Find("KEYFORMATVERSIONS"));
}

SessionKey::SessionKey(EnumeratedString<KeyMethod> _method, std::string _uri)
	:method(std::string{_method.AsString()}), uri(std::move(_uri))
{
	InitOutputLine();
}

std::string
SessionKey::CalculateLine() const
{
	LineBuilder b{NAME};
	b.Unquoted("METHOD", method.Get())
		.Quoted("URI", uri.Get())
		.Unquoted("IV", GetIv());

	if (const auto k = GetKeyformat(); k != DEFAULT_KEYFORMAT)
		b.Quoted("KEYFORMAT", k);

	return b.Quoted("KEYFORMATVERSIONS", GetKeyformatversions())
		.Finish();
}

} // namespace Hls
