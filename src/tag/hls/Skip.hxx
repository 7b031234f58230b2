// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_SKIP_HXX
#define HLS_TAG_SKIP_HXX

#include "tag/DirtyLineTag.hxx"
#include "tag/LazyAttribute.hxx"
#include "tag/TagName.hxx"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-SKIP
 */
class Skip final : public DirtyLineTag {
	uint64_t skipped_segments;
	LazyAttribute<std::string> recently_removed_dateranges;

public:
	static constexpr TagName NAME = TagName::SKIP;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit Skip(const ParsedTag &tag);

	explicit Skip(uint64_t _skipped_segments);

	uint64_t GetSkippedSegments() const noexcept {
		return skipped_segments;
	}

	/**
	 * The tab-delimited list of removed EXT-X-DATERANGE ids.
	 */
	std::optional<std::string_view> GetRecentlyRemovedDateranges() const noexcept {
		return recently_removed_dateranges.Get<std::string_view>(GetQuotedString);
	}

	void SetSkippedSegments(uint64_t value) noexcept {
		skipped_segments = value;
		MarkDirty();
	}

	void SetRecentlyRemovedDateranges(std::string value) noexcept {
		recently_removed_dateranges.Set(std::move(value));
		MarkDirty();
	}

	void UnsetRecentlyRemovedDateranges() noexcept {
		recently_removed_dateranges.Unset();
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
