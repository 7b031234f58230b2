// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_CONTENT_STEERING_HXX
#define HLS_TAG_CONTENT_STEERING_HXX

#include "tag/DirtyLineTag.hxx"
#include "tag/LazyAttribute.hxx"
#include "tag/MaybeOwnedString.hxx"
#include "tag/TagName.hxx"

#include <optional>
#include <string>
#include <string_view>

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-CONTENT-STEERING
 */
class ContentSteering final : public DirtyLineTag {
	MaybeOwnedString server_uri;
	LazyAttribute<std::string> pathway_id;

public:
	static constexpr TagName NAME = TagName::CONTENT_STEERING;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit ContentSteering(const ParsedTag &tag);

	explicit ContentSteering(std::string _server_uri);

	std::string_view GetServerUri() const noexcept {
		return server_uri.Get();
	}

	std::optional<std::string_view> GetPathwayId() const noexcept {
		return pathway_id.Get<std::string_view>(GetQuotedString);
	}

	void SetServerUri(std::string value) noexcept {
		server_uri = MaybeOwnedString{std::move(value)};
		MarkDirty();
	}

	void SetPathwayId(std::string value) noexcept {
		pathway_id.Set(std::move(value));
		MarkDirty();
	}

	void UnsetPathwayId() noexcept {
		pathway_id.Unset();
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
