// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_WRITER_HXX
#define HLS_WRITER_HXX

#include "Line.hxx"

#include <string_view>

class OutputStream;

namespace Hls {

class CustomTag;

/**
 * Writes playlist lines to an #OutputStream; each line is
 * terminated with "\n".
 */
class Writer {
	OutputStream &os;

public:
	explicit Writer(OutputStream &_os) noexcept
		:os(_os) {}

	/**
	 * Write a line; tag records are consumed, their output line
	 * is recomputed only if they were modified.
	 *
	 * Throws on I/O error.
	 */
	void WriteLine(HlsLine &&line);

	void WriteBlank();

	/**
	 * @param text the comment without the leading "#"
	 */
	void WriteComment(std::string_view text);

	void WriteUri(std::string_view uri);

	void WriteTag(Tag &&tag);

	/**
	 * Write a custom tag which was not obtained from a parsed
	 * line.
	 */
	void WriteCustomTag(const CustomTag &tag);

private:
	void WriteRaw(std::string_view line);
};

} // namespace Hls

#endif
