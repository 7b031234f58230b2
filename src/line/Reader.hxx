// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_READER_HXX
#define HLS_READER_HXX

#include "Line.hxx"
#include "config/ParsingOptions.hxx"

#include <optional>
#include <stdexcept>
#include <string_view>

namespace Hls {

/**
 * Thrown by Reader::ReadLine() with the #SyntaxError nested.  The
 * #Reader has already skipped the bad line, so reading may continue.
 */
class ReaderError : public std::runtime_error {
	std::string_view errored_line;

public:
	explicit ReaderError(std::string_view _errored_line);

	/**
	 * The line which failed to parse (without line terminator);
	 * it points into the #Reader's input buffer.
	 */
	std::string_view GetErroredLine() const noexcept {
		return errored_line;
	}
};

/**
 * Iterates over the lines of a playlist in a caller-owned buffer.
 */
class Reader {
	std::string_view input;

	const ParsingOptions options;

	const CustomTagProvider *const custom;

public:
	/**
	 * @param _input the playlist; it must outlive all lines
	 * returned by this object
	 * @param _custom an optional provider of application tag types;
	 * it must outlive this object
	 */
	explicit Reader(std::string_view _input,
			const ParsingOptions &_options=ParsingOptions::All(),
			const CustomTagProvider *_custom=nullptr) noexcept
		:input(_input), options(_options), custom(_custom) {}

	bool IsEnd() const noexcept {
		return input.empty();
	}

	/**
	 * Parse the next line.
	 *
	 * Throws #ReaderError on error.
	 *
	 * @return the line or std::nullopt at the end of the input
	 */
	std::optional<HlsLine> ReadLine();
};

} // namespace Hls

#endif
