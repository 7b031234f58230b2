// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "util/SpanCast.hxx"

#include <cstddef>
#include <span>
#include <string_view>

class OutputStream {
public:
	OutputStream() = default;
	OutputStream(const OutputStream &) = delete;

	/**
	 * Throws std::exception on error.
	 */
	virtual void Write(std::span<const std::byte> src) = 0;

	void Write(std::string_view src) {
		Write(AsBytes(src));
	}
};
