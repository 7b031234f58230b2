// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_MAP_HXX
#define HLS_TAG_MAP_HXX

#include "tag/DirtyLineTag.hxx"
#include "tag/LazyAttribute.hxx"
#include "tag/MaybeOwnedString.hxx"
#include "tag/TagName.hxx"
#include "value/TagValue.hxx"

#include <optional>
#include <string>
#include <string_view>

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-MAP
 */
class Map final : public DirtyLineTag {
	MaybeOwnedString uri;
	LazyAttribute<DecimalIntegerRange> byterange;

public:
	static constexpr TagName NAME = TagName::MAP;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit Map(const ParsedTag &tag);

	explicit Map(std::string _uri);

	std::string_view GetUri() const noexcept {
		return uri.Get();
	}

	/**
	 * The BYTERANGE; the offset is mandatory in this tag and
	 * is treated as 0 if missing.
	 */
	std::optional<DecimalIntegerRange> GetByterange() const noexcept;

	void SetUri(std::string value) noexcept {
		uri = MaybeOwnedString{std::move(value)};
		MarkDirty();
	}

	void SetByterange(uint64_t length, uint64_t offset) noexcept {
		byterange.Set({length, offset});
		MarkDirty();
	}

	void UnsetByterange() noexcept {
		byterange.Unset();
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
