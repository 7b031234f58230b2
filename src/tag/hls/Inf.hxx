// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_INF_HXX
#define HLS_TAG_INF_HXX

#include "tag/DirtyLineTag.hxx"
#include "tag/MaybeOwnedString.hxx"
#include "tag/TagName.hxx"

#include <string>
#include <string_view>

namespace Hls {

struct ParsedTag;

/**
 * EXTINF: "<duration>,[<title>]"
 */
class Inf final : public DirtyLineTag {
	double duration;
	MaybeOwnedString title;

public:
	static constexpr TagName NAME = TagName::INF;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit Inf(const ParsedTag &tag);

	explicit Inf(double _duration, std::string _title={});

	double GetDuration() const noexcept {
		return duration;
	}

	/**
	 * @return the title or an empty string
	 */
	std::string_view GetTitle() const noexcept {
		return title.Get();
	}

	void SetDuration(double _duration) noexcept {
		duration = _duration;
		MarkDirty();
	}

	void SetTitle(std::string _title) noexcept {
		title = MaybeOwnedString{std::move(_title)};
		MarkDirty();
	}

	void UnsetTitle() noexcept {
		title = MaybeOwnedString{};
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
