// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_BYTERANGE_HXX
#define HLS_TAG_BYTERANGE_HXX

#include "tag/DirtyLineTag.hxx"
#include "tag/TagName.hxx"

#include <cstdint>
#include <optional>

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-BYTERANGE: "<length>[@<offset>]"
 */
class Byterange final : public DirtyLineTag {
	uint64_t length;
	std::optional<uint64_t> offset;

public:
	static constexpr TagName NAME = TagName::BYTERANGE;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit Byterange(const ParsedTag &tag);

	explicit Byterange(uint64_t _length,
			   std::optional<uint64_t> _offset=std::nullopt);

	uint64_t GetLength() const noexcept {
		return length;
	}

	std::optional<uint64_t> GetOffset() const noexcept {
		return offset;
	}

	void SetLength(uint64_t _length) noexcept {
		length = _length;
		MarkDirty();
	}

	void SetOffset(uint64_t _offset) noexcept {
		offset = _offset;
		MarkDirty();
	}

	void UnsetOffset() noexcept {
		offset.reset();
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
