// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "OutputStream.hxx"

#include <cerrno>
#include <system_error>

#include <stdio.h>

class StdioOutputStream final : public OutputStream {
	FILE *const file;

public:
	explicit StdioOutputStream(FILE *_file) noexcept:file(_file) {}

	using OutputStream::Write;

	/**
	 * Throws std::system_error on error.
	 */
	void Flush() {
		if (fflush(file) != 0)
			throw std::system_error(errno, std::generic_category(),
						"Failed to flush");
	}

	/* virtual methods from class OutputStream */
	void Write(std::span<const std::byte> src) override {
		if (fwrite(src.data(), 1, src.size(), file) != src.size())
			throw std::system_error(errno, std::generic_category(),
						"Failed to write");
	}
};
