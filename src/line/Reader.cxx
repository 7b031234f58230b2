// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Reader.hxx"
#include "SyntaxError.hxx"
#include "Log.hxx"
#include "util/ByteSearch.hxx"
#include "util/Domain.hxx"

#include <fmt/format.h>

#include <exception>

namespace Hls {

static constexpr Domain reader_domain("reader");

ReaderError::ReaderError(std::string_view _errored_line)
	:std::runtime_error(fmt::format("Malformed line \"{}\"",
					_errored_line)),
	 errored_line(_errored_line)
{
}

/**
 * Skip the first line of the input.
 *
 * @return the skipped line without line terminator
 */
static std::string_view
SkipLine(std::string_view &input) noexcept
{
	auto line = input;

	if (const auto lf = FindChar(input, '\n'); lf != input.npos) {
		line = input.substr(0, lf);
		input = input.substr(lf + 1);
	} else
		input = {};

	if (line.ends_with('\r'))
		line.remove_suffix(1);

	return line;
}

std::optional<HlsLine>
Reader::ReadLine()
{
	if (input.empty())
		return std::nullopt;

	try {
		auto result = ParseLine(input, options, custom);
		input = result.remaining.value_or(std::string_view{});
		return std::move(result.line);
	} catch (const SyntaxError &) {
		const auto line = SkipLine(input);
		FmtDebug(reader_domain, "Skipping malformed line \"{}\"", line);
		std::throw_with_nested(ReaderError{line});
	}
}

} // namespace Hls
