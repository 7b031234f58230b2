// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_DIRTY_LINE_TAG_HXX
#define HLS_DIRTY_LINE_TAG_HXX

#include "MaybeOwnedString.hxx"

#include <string>
#include <string_view>
#include <utility>

namespace Hls {

/**
 * Base class for all tag records.  It caches the output line: after
 * parsing, this is the original input line; after construction from
 * typed values, it is computed once.  Mutators only set the "dirty"
 * flag, and the line is recomputed by IntoInner() only if that flag
 * is set.
 */
class DirtyLineTag {
	TagInner output_line;

	bool dirty = false;

protected:
	/**
	 * Construct from a parsed tag; the output line refers to the
	 * original input.
	 */
	explicit DirtyLineTag(std::string_view original_input) noexcept
		:output_line(original_input) {}

	/**
	 * Construct from typed values; the derived constructor must
	 * call InitOutputLine().
	 */
	DirtyLineTag() noexcept = default;

	DirtyLineTag(const DirtyLineTag &) = default;
	DirtyLineTag(DirtyLineTag &&) noexcept = default;
	DirtyLineTag &operator=(const DirtyLineTag &) = default;
	DirtyLineTag &operator=(DirtyLineTag &&) noexcept = default;

	void InitOutputLine() {
		output_line = TagInner{CalculateLine()};
	}

	void MarkDirty() noexcept {
		dirty = true;
	}

	/**
	 * Render the complete line (including the "#EXT" marker, but
	 * without line terminator) from the current field values.
	 */
	virtual std::string CalculateLine() const = 0;

public:
	virtual ~DirtyLineTag() noexcept = default;

	bool IsDirty() const noexcept {
		return dirty;
	}

	/**
	 * Finalize the output line, recomputing it if the record was
	 * modified.
	 */
	TagInner IntoInner() && {
		if (dirty)
			return TagInner{CalculateLine()};

		return std::move(output_line);
	}

	/**
	 * Like IntoInner(), but does not consume the record; the
	 * returned line is always owned.
	 */
	std::string ToString() const {
		if (dirty)
			return CalculateLine();

		return std::string{output_line.Get()};
	}
};

} // namespace Hls

#endif
