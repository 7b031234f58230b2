// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_RENDITION_REPORT_HXX
#define HLS_TAG_RENDITION_REPORT_HXX

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
 * EXT-X-RENDITION-REPORT
 */
class RenditionReport final : public DirtyLineTag {
	MaybeOwnedString uri;
	uint64_t last_msn;
	LazyAttribute<uint64_t> last_part;

public:
	static constexpr TagName NAME = TagName::RENDITION_REPORT;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit RenditionReport(const ParsedTag &tag);

	RenditionReport(std::string _uri, uint64_t _last_msn);

	std::string_view GetUri() const noexcept {
		return uri.Get();
	}

	uint64_t GetLastMsn() const noexcept {
		return last_msn;
	}

	std::optional<uint64_t> GetLastPart() const noexcept {
		return last_part.Get(GetDecimalInteger);
	}

	void SetUri(std::string value) noexcept {
		uri = MaybeOwnedString{std::move(value)};
		MarkDirty();
	}

	void SetLastMsn(uint64_t value) noexcept {
		last_msn = value;
		MarkDirty();
	}

	void SetLastPart(uint64_t value) noexcept {
		last_part.Set(value);
		MarkDirty();
	}

	void UnsetLastPart() noexcept {
		last_part.Unset();
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
