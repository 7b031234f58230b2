// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_PRELOAD_HINT_HXX
#define HLS_TAG_PRELOAD_HINT_HXX

#include "Enumerations.hxx"
#include "tag/DirtyLineTag.hxx"
#include "tag/LazyAttribute.hxx"
#include "tag/MaybeOwnedString.hxx"
#include "tag/TagName.hxx"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-PRELOAD-HINT
 */
class PreloadHint final : public DirtyLineTag {
	MaybeOwnedString type;
	MaybeOwnedString uri;
	LazyAttribute<uint64_t> byterange_start;
	LazyAttribute<uint64_t> byterange_length;

public:
	static constexpr TagName NAME = TagName::PRELOAD_HINT;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit PreloadHint(const ParsedTag &tag);

	PreloadHint(EnumeratedString<PreloadHintType> _type, std::string _uri);

	EnumeratedString<PreloadHintType> GetType() const noexcept {
		return EnumeratedString<PreloadHintType>{type.Get()};
	}

	std::string_view GetUri() const noexcept {
		return uri.Get();
	}

	/**
	 * @return the BYTERANGE-START, 0 if absent
	 */
	uint64_t GetByterangeStart() const noexcept {
		return byterange_start.Get(GetDecimalInteger).value_or(0);
	}

	std::optional<uint64_t> GetByterangeLength() const noexcept {
		return byterange_length.Get(GetDecimalInteger);
	}

	void SetType(EnumeratedString<PreloadHintType> value) {
		type = MaybeOwnedString{std::string{value.AsString()}};
		MarkDirty();
	}

	void SetUri(std::string value) noexcept {
		uri = MaybeOwnedString{std::move(value)};
		MarkDirty();
	}

	void SetByterangeStart(uint64_t value) noexcept {
		byterange_start.Set(value);
		MarkDirty();
	}

	void UnsetByterangeStart() noexcept {
		byterange_start.Unset();
		MarkDirty();
	}

	void SetByterangeLength(uint64_t value) noexcept {
		byterange_length.Set(value);
		MarkDirty();
	}

	void UnsetByterangeLength() noexcept {
		byterange_length.Unset();
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
