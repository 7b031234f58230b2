// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "TagValue.hxx"
#include "SyntaxError.hxx"
#include "util/ByteSearch.hxx"
#include "util/NumberParser.hxx"
#include "util/UTF8.hxx"

#include <cmath>
#include <tuple>
#include <utility>

namespace Hls {

/**
 * Cut the given value at the line feed at position #lf (or npos) and
 * remove a carriage return preceding it.
 */
static std::pair<std::string_view, std::optional<std::string_view>>
CutLine(std::string_view input, std::size_t lf) noexcept
{
	if (lf == input.npos)
		return {input, std::nullopt};

	auto line = input.substr(0, lf);
	if (line.ends_with('\r'))
		line.remove_suffix(1);

	return {line, input.substr(lf + 1)};
}

static void
CheckUTF8(std::string_view s)
{
	if (!ValidateUTF8(s))
		throw SyntaxError{SyntaxErrorCode::INVALID_UTF8};
}

/**
 * Classify a bare numeric-looking token (without a dot) or fall back
 * to an unquoted string.
 */
static AttributeValue
ClassifyBareToken(std::string_view token)
{
	if (const auto i = ParseInteger<uint64_t>(token))
		return *i;

	if (const auto d = ParseDouble(token)) {
		/* 2^64 */
		constexpr double limit = 18446744073709551616.0;
		if (*d >= 0 && *d < limit && std::trunc(*d) == *d)
			return static_cast<uint64_t>(*d);
		return *d;
	}

	CheckUTF8(token);
	return UnquotedString{token};
}

static AttributeValueResult
ParseQuotedAttributeValue(std::string_view input)
{
	const auto body = input.substr(1);
	const auto close = FindFirstOf(body, '"', '\n');
	if (close == body.npos || body[close] != '"')
		throw SyntaxError{SyntaxErrorCode::UNEXPECTED_END_OF_LINE_WITHIN_QUOTED_STRING};

	const auto value = body.substr(0, close);
	CheckUTF8(value);

	const auto after = body.substr(close + 1);
	if (after.empty())
		return {QuotedString{value}, std::nullopt, false};

	switch (after.front()) {
	case ',':
		return {QuotedString{value}, after.substr(1), true};

	case '\n':
		return {QuotedString{value}, after.substr(1), false};

	case '\r':
		if (after.size() >= 2 && after[1] == '\n')
			return {QuotedString{value}, after.substr(2), false};
		break;
	}

	throw SyntaxError::UnexpectedCharacterAfterQuotedString(after.front());
}

AttributeValueResult
ParseOneAttributeValue(std::string_view input)
{
	if (!input.empty() && input.front() == '"')
		return ParseQuotedAttributeValue(input);

	auto end = FindFirstOf(input, ',', '\n', '.');
	bool has_dot = false;
	if (end != input.npos && input[end] == '.') {
		/* don't stop in the middle of the fractional part */
		has_dot = true;
		const auto tail = FindFirstOf(input.substr(end + 1), ',', '\n');
		end = tail == input.npos ? input.npos : end + 1 + tail;
	}

	std::string_view token;
	std::optional<std::string_view> remaining;
	bool more = false;

	if (end == input.npos) {
		token = input;
	} else if (input[end] == ',') {
		token = input.substr(0, end);
		remaining = input.substr(end + 1);
		more = true;
	} else {
		std::tie(token, remaining) = CutLine(input, end);
	}

	if (token.empty())
		throw SyntaxError{SyntaxErrorCode::UNEXPECTED_EMPTY_ATTRIBUTE_VALUE};

	if (has_dot) {
		const auto d = ParseDouble(token);
		if (!d)
			throw SyntaxError{SyntaxErrorCode::INVALID_FLOAT_IN_ATTRIBUTE_VALUE};

		return {*d, remaining, more};
	}

	return {ClassifyBareToken(token), remaining, more};
}

static ClassifyResult
ParseAttributeList(std::string_view name, std::string_view input)
{
	AttributeList list;

	while (true) {
		if (name.empty())
			throw SyntaxError{SyntaxErrorCode::EMPTY_ATTRIBUTE_NAME};

		CheckUTF8(name);

		auto [value, remaining, more] = ParseOneAttributeValue(input);
		list.Add(name, value);

		if (!more)
			return {std::move(list), remaining};

		/* a comma was found, so there is always a remaining
		   input here */
		input = *remaining;
		const auto eq = input.find_first_of("=\n,\"");
		if (eq == input.npos || input[eq] == '\n')
			throw SyntaxError{SyntaxErrorCode::UNEXPECTED_END_OF_LINE_WHILE_READING_ATTRIBUTE_NAME};

		if (input[eq] != '=')
			throw SyntaxError{SyntaxErrorCode::UNEXPECTED_CHARACTER_IN_ATTRIBUTE_NAME};

		name = input.substr(0, eq);
		input = input.substr(eq + 1);
	}
}

static ClassifyResult
ParseFloatWithTitle(std::string_view input, std::size_t comma)
{
	const auto number = ParseDouble(input.substr(0, comma));
	if (!number)
		throw SyntaxError{SyntaxErrorCode::INVALID_FLOAT_FOR_DECIMAL_FLOATING_POINT};

	const auto rest = input.substr(comma + 1);
	const auto [title, remaining] = CutLine(rest, FindChar(rest, '\n'));
	CheckUTF8(title);

	return {FloatWithTitle{*number, title}, remaining};
}

ClassifyResult
ClassifyTagValue(std::string_view input)
{
	const auto i = FindFirstOf(input, '\n', ',', '=');
	if (i != input.npos) {
		switch (input[i]) {
		case '=':
			if (input.substr(0, i).find('"') != input.npos)
				throw SyntaxError{SyntaxErrorCode::UNEXPECTED_CHARACTER_IN_ATTRIBUTE_NAME};

			return ParseAttributeList(input.substr(0, i),
						  input.substr(i + 1));

		case ',':
			return ParseFloatWithTitle(input, i);
		}
	}

	const auto [value, remaining] = CutLine(input, i);
	if (value.empty())
		return {EmptyValue{}, remaining};

	return {UnparsedValue{value}, remaining};
}

} // namespace Hls
