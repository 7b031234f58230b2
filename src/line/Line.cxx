// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Line.hxx"
#include "SyntaxError.hxx"
#include "ValidationError.hxx"
#include "Log.hxx"
#include "config/ParsingOptions.hxx"
#include "tag/ParsedTag.hxx"
#include "util/ByteSearch.hxx"
#include "util/Domain.hxx"
#include "util/Exception.hxx"
#include "util/UTF8.hxx"

namespace Hls {

static constexpr Domain line_domain("line");

/**
 * Split off the first line; the line terminator ("\n" or "\r\n") is
 * not part of the line.
 */
static ParseLineResult
SplitLine(std::string_view input, std::string_view &line)
{
	const auto lf = FindChar(input, '\n');
	std::optional<std::string_view> remaining;

	if (lf == input.npos) {
		line = input;
	} else {
		line = input.substr(0, lf);
		remaining = input.substr(lf + 1);

		if (line.ends_with('\r'))
			line.remove_suffix(1);
	}

	if (FindChar(line, '\r') != line.npos)
		throw SyntaxError{SyntaxErrorCode::CARRIAGE_RETURN_WITHOUT_LINE_FEED};

	return {BlankLine{}, remaining};
}

static SemiParsedTagValue
ClassifyValue(std::optional<std::string_view> value)
{
	if (!value)
		return EmptyValue{};

	return ClassifyTagValue(*value).value;
}

/**
 * Convert a tokenized tag with the given function; a
 * #ValidationError downgrades it to an #UnknownTag.
 */
template<typename F>
static HlsLine
ConvertTag(UnknownTag &&unknown, F &&f)
{
	try {
		return f();
	} catch (const ValidationError &e) {
		FmtDebug(line_domain, "Invalid tag \"#EXT{}\": {}",
			 unknown.name, GetFullMessage(e));
		unknown.error = std::current_exception();
		return std::move(unknown);
	}
}

static HlsLine
ParseTagLine(std::string_view line, const ParsingOptions &options,
	     const CustomTagProvider *custom)
{
	auto rest = line.substr(TAG_MARKER.size());

	UnknownTag unknown{};
	unknown.original_input = line;

	if (const auto colon = FindChar(rest, ':'); colon != rest.npos) {
		unknown.name = rest.substr(0, colon);
		unknown.value = rest.substr(colon + 1);
	} else
		unknown.name = rest;

	if (unknown.name.empty())
		throw SyntaxError{SyntaxErrorCode::NO_TAG_NAME};

	if (custom != nullptr && custom->IsKnownName(unknown.name)) {
		const ParsedTag tag{unknown.name, ClassifyValue(unknown.value), line};
		return ConvertTag(std::move(unknown), [custom, &tag, line]() -> HlsLine {
			return CustomTagAccess{custom->Parse(tag), line};
		});
	}

	const auto name = ParseTagName(unknown.name);
	if (name == TagName::UNKNOWN || !options.IsKnownNameEnabled(name))
		return unknown;

	const ParsedTag tag{unknown.name, ClassifyValue(unknown.value), line};
	return ConvertTag(std::move(unknown), [name, &tag]() -> HlsLine {
		return ParseKnownTag(name, tag);
	});
}

ParseLineResult
ParseLine(std::string_view input, const ParsingOptions &options,
	  const CustomTagProvider *custom)
{
	std::string_view line;
	auto result = SplitLine(input, line);

	if (line.empty())
		return result;

	if (!ValidateUTF8(line))
		throw SyntaxError{SyntaxErrorCode::INVALID_UTF8};

	if (line.starts_with(TAG_MARKER))
		result.line = ParseTagLine(line, options, custom);
	else if (line.front() == '#')
		result.line = CommentLine{line.substr(1)};
	else
		result.line = UriLine{line};

	return result;
}

} // namespace Hls
