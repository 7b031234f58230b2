// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_UNKNOWN_TAG_HXX
#define HLS_UNKNOWN_TAG_HXX

#include <exception>
#include <optional>
#include <string_view>

namespace Hls {

/**
 * A tag which was not converted to a typed record: either its name
 * is not known (or not enabled), or a built-in record rejected it.
 * It is written back verbatim.
 */
struct UnknownTag {
	/**
	 * The name after "#EXT".
	 */
	std::string_view name;

	/**
	 * The text after the colon; std::nullopt if there was no
	 * colon.
	 */
	std::optional<std::string_view> value;

	/**
	 * The complete line without the line terminator.
	 */
	std::string_view original_input;

	/**
	 * If a built-in record rejected this tag, then this is the
	 * #ValidationError it threw.
	 */
	std::exception_ptr error;

	bool IsInvalid() const noexcept {
		return error != nullptr;
	}
};

} // namespace Hls

#endif
