// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

/*
 * Helpers for the constructors of tag records which convert a
 * #ParsedTag.  All of them throw #ValidationError.
 */

#ifndef HLS_EXTRACT_HXX
#define HLS_EXTRACT_HXX

#include "TagName.hxx"
#include "ValidationError.hxx"
#include "value/TagValue.hxx"

#include <cstdint>
#include <exception>
#include <string_view>
#include <utility>

namespace Hls {

struct ParsedTag;

void
CheckTagName(const ParsedTag &tag, TagName expected);

const AttributeList &
GetAttributeList(const ParsedTag &tag);

/**
 * CheckTagName() plus GetAttributeList(), for constructor
 * initializer lists.
 */
const AttributeList &
GetAttributeList(const ParsedTag &tag, TagName expected);

const UnparsedValue &
GetUnparsedValue(const ParsedTag &tag);

/**
 * Invoke the given function which extracts the tag value; all
 * exceptions are nested inside a #ValidationError with the code
 * ERROR_EXTRACTING_TAG_VALUE.
 */
template<typename F>
auto
ExtractTagValue(F &&f)
{
	try {
		return std::forward<F>(f)();
	} catch (...) {
		std::throw_with_nested(ValidationError::ErrorExtractingTagValue());
	}
}

const AttributeValue &
RequireAttribute(const AttributeList &list, std::string_view name);

std::string_view
RequireQuotedString(const AttributeList &list, std::string_view name);

std::string_view
RequireUnquotedString(const AttributeList &list, std::string_view name);

uint64_t
RequireDecimalInteger(const AttributeList &list, std::string_view name);

double
RequireDecimalFloat(const AttributeList &list, std::string_view name);

} // namespace Hls

#endif
