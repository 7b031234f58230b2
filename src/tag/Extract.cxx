// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Extract.hxx"
#include "ParsedTag.hxx"

namespace Hls {

void
CheckTagName(const ParsedTag &tag, TagName expected)
{
	if (tag.name != GetTagNameString(expected))
		throw ValidationError::UnexpectedTagName(tag.name);
}

const AttributeList &
GetAttributeList(const ParsedTag &tag)
{
	const auto *list = std::get_if<AttributeList>(&tag.value);
	if (list == nullptr)
		throw ValidationError::UnexpectedValueType("attribute list");

	return *list;
}

const AttributeList &
GetAttributeList(const ParsedTag &tag, TagName expected)
{
	CheckTagName(tag, expected);
	return GetAttributeList(tag);
}

const UnparsedValue &
GetUnparsedValue(const ParsedTag &tag)
{
	const auto *value = std::get_if<UnparsedValue>(&tag.value);
	if (value == nullptr)
		throw ValidationError::UnexpectedValueType("plain value");

	return *value;
}

const AttributeValue &
RequireAttribute(const AttributeList &list, std::string_view name)
{
	const auto *value = list.Find(name);
	if (value == nullptr)
		throw ValidationError::MissingRequiredAttribute(name);

	return *value;
}

/**
 * Apply the given reinterpretation to a required attribute.
 */
template<typename F>
static auto
RequireAs(const AttributeList &list, std::string_view name, F &&f)
{
	const auto result = f(RequireAttribute(list, name));
	if (!result)
		throw ValidationError::ErrorExtractingAttributeListValue(name);

	return *result;
}

std::string_view
RequireQuotedString(const AttributeList &list, std::string_view name)
{
	return RequireAs(list, name, GetQuotedString);
}

std::string_view
RequireUnquotedString(const AttributeList &list, std::string_view name)
{
	return RequireAs(list, name, GetUnquotedString);
}

uint64_t
RequireDecimalInteger(const AttributeList &list, std::string_view name)
{
	return RequireAs(list, name, GetDecimalInteger);
}

double
RequireDecimalFloat(const AttributeList &list, std::string_view name)
{
	return RequireAs(list, name, GetDecimalFloat);
}

} // namespace Hls
