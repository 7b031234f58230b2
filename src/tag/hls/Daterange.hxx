// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_DATERANGE_HXX
#define HLS_TAG_DATERANGE_HXX

#include "Enumerations.hxx"
#include "tag/DirtyLineTag.hxx"
#include "tag/EnumeratedStringList.hxx"
#include "tag/LazyAttribute.hxx"
#include "tag/MaybeOwnedString.hxx"
#include "tag/TagName.hxx"
#include "tag/WritableTag.hxx"
#include "time/DateTime.hxx"

#include <optional>
#include <string>
#include <string_view>

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-DATERANGE
 *
 * Client-defined attributes (names beginning with "X-") are copied
 * at parse time and rendered in their original order after the
 * standard attributes.
 */
class Daterange final : public DirtyLineTag {
	MaybeOwnedString id;
	DateTime start_date;
	LazyAttribute<std::string> class_;
	LazyAttribute<std::string> cue;
	LazyAttribute<DateTime> end_date;
	LazyAttribute<double> duration;
	LazyAttribute<double> planned_duration;
	WritableAttributeList client_attributes;
	LazyAttribute<std::string> scte35_cmd;
	LazyAttribute<std::string> scte35_out;
	LazyAttribute<std::string> scte35_in;
	LazyAttribute<bool> end_on_next;

public:
	static constexpr TagName NAME = TagName::DATERANGE;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit Daterange(const ParsedTag &tag);

	Daterange(std::string _id, const DateTime &_start_date);

	std::string_view GetId() const noexcept {
		return id.Get();
	}

	const DateTime &GetStartDate() const noexcept {
		return start_date;
	}

	std::optional<std::string_view> GetClass() const noexcept {
		return class_.Get<std::string_view>(GetQuotedString);
	}

	std::optional<EnumeratedStringList<Cue>> GetCue() const noexcept;

	std::optional<DateTime> GetEndDate() const noexcept;

	std::optional<double> GetDuration() const noexcept {
		return duration.Get(GetDecimalFloat);
	}

	std::optional<double> GetPlannedDuration() const noexcept {
		return planned_duration.Get(GetDecimalFloat);
	}

	const WritableAttributeList &GetClientAttributes() const noexcept {
		return client_attributes;
	}

	/**
	 * @param name the attribute name including the "X-" prefix
	 * @return nullptr if there is no such attribute
	 */
	[[gnu::pure]]
	const WritableAttributeValue *GetClientAttribute(std::string_view name) const noexcept;

	std::optional<std::string_view> GetScte35Cmd() const noexcept {
		return scte35_cmd.Get<std::string_view>(GetUnquotedString);
	}

	std::optional<std::string_view> GetScte35Out() const noexcept {
		return scte35_out.Get<std::string_view>(GetUnquotedString);
	}

	std::optional<std::string_view> GetScte35In() const noexcept {
		return scte35_in.Get<std::string_view>(GetUnquotedString);
	}

	bool IsEndOnNext() const noexcept {
		return end_on_next.Get(GetYesNo).value_or(false);
	}

	void SetId(std::string value) noexcept {
		id = MaybeOwnedString{std::move(value)};
		MarkDirty();
	}

	void SetStartDate(const DateTime &value) noexcept {
		start_date = value;
		MarkDirty();
	}

	void SetClass(std::string value) noexcept {
		class_.Set(std::move(value));
		MarkDirty();
	}

	void UnsetClass() noexcept {
		class_.Unset();
		MarkDirty();
	}

	void SetCue(const EnumeratedStringList<Cue> &value) {
		cue.Set(std::string{value.AsString()});
		MarkDirty();
	}

	void UnsetCue() noexcept {
		cue.Unset();
		MarkDirty();
	}

	void SetEndDate(const DateTime &value) noexcept {
		end_date.Set(value);
		MarkDirty();
	}

	void UnsetEndDate() noexcept {
		end_date.Unset();
		MarkDirty();
	}

	void SetDuration(double value) noexcept {
		duration.Set(value);
		MarkDirty();
	}

	void UnsetDuration() noexcept {
		duration.Unset();
		MarkDirty();
	}

	void SetPlannedDuration(double value) noexcept {
		planned_duration.Set(value);
		MarkDirty();
	}

	void UnsetPlannedDuration() noexcept {
		planned_duration.Unset();
		MarkDirty();
	}

	/**
	 * Add or replace a client-defined attribute.
	 *
	 * @param name the attribute name including the "X-" prefix
	 */
	void SetClientAttribute(std::string_view name,
				WritableAttributeValue value);

	void UnsetClientAttribute(std::string_view name) noexcept;

	void SetScte35Cmd(std::string value) noexcept {
		scte35_cmd.Set(std::move(value));
		MarkDirty();
	}

	void UnsetScte35Cmd() noexcept {
		scte35_cmd.Unset();
		MarkDirty();
	}

	void SetScte35Out(std::string value) noexcept {
		scte35_out.Set(std::move(value));
		MarkDirty();
	}

	void UnsetScte35Out() noexcept {
		scte35_out.Unset();
		MarkDirty();
	}

	void SetScte35In(std::string value) noexcept {
		scte35_in.Set(std::move(value));
		MarkDirty();
	}

	void UnsetScte35In() noexcept {
		scte35_in.Unset();
		MarkDirty();
	}

	void SetEndOnNext(bool value) noexcept {
		end_on_next.Set(value);
		MarkDirty();
	}

	void UnsetEndOnNext() noexcept {
		end_on_next.Unset();
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
