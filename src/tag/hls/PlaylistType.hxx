// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_PLAYLIST_TYPE_HXX
#define HLS_TAG_PLAYLIST_TYPE_HXX

#include "tag/DirtyLineTag.hxx"
#include "tag/TagName.hxx"
#include "value/TagValue.hxx"

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-PLAYLIST-TYPE
 */
class PlaylistType final : public DirtyLineTag {
	PlaylistTypeValue type;

public:
	static constexpr TagName NAME = TagName::PLAYLIST_TYPE;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit PlaylistType(const ParsedTag &tag);

	explicit PlaylistType(PlaylistTypeValue _type);

	PlaylistTypeValue GetType() const noexcept {
		return type;
	}

	void SetType(PlaylistTypeValue _type) noexcept {
		type = _type;
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
