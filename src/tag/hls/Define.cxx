// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Define.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"

namespace Hls {

Define::Define(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &list = GetAttributeList(tag);

	if (list.Find("NAME") != nullptr) {
		kind = Kind::NAME;
		name = MaybeOwnedString{RequireQuotedString(list, "NAME")};
		value = MaybeOwnedString{RequireQuotedString(list, "VALUE")};
	} else if (list.Find("IMPORT") != nullptr) {
		kind = Kind::IMPORT;
		name = MaybeOwnedString{RequireQuotedString(list, "IMPORT")};
	} else if (list.Find("QUERYPARAM") != nullptr) {
		kind = Kind::QUERYPARAM;
		name = MaybeOwnedString{RequireQuotedString(list, "QUERYPARAM")};
	} else
		throw ValidationError::MissingRequiredAttribute("NAME");
}

Define::Define(std::string _name, std::string _value)
	:kind(Kind::NAME), name(std::move(_name)), value(std::move(_value))
{
	InitOutputLine();
}

Define::Define(Kind _kind, std::string _name)
	:kind(_kind), name(std::move(_name))
{
	InitOutputLine();
}

std::string
Define::CalculateLine() const
{
	LineBuilder b{NAME};

	switch (kind) {
	case Kind::NAME:
		b.Quoted("NAME", name.Get()).Quoted("VALUE", value.Get());
		break;

	case Kind::IMPORT:
		b.Quoted("IMPORT", name.Get());
		break;

	case Kind::QUERYPARAM:
		b.Quoted("QUERYPARAM", name.Get());
		break;
	}

	return b.Finish();
}

} // namespace Hls
