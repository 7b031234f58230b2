// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_PROGRAM_DATE_TIME_HXX
#define HLS_TAG_PROGRAM_DATE_TIME_HXX

#include "tag/DirtyLineTag.hxx"
#include "tag/TagName.hxx"
#include "time/DateTime.hxx"

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-PROGRAM-DATE-TIME
 */
class ProgramDateTime final : public DirtyLineTag {
	DateTime date_time;

public:
	static constexpr TagName NAME = TagName::PROGRAM_DATE_TIME;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit ProgramDateTime(const ParsedTag &tag);

	explicit ProgramDateTime(const DateTime &_date_time);

	const DateTime &GetDateTime() const noexcept {
		return date_time;
	}

	void SetDateTime(const DateTime &_date_time) noexcept {
		date_time = _date_time;
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
