// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_SESSION_DATA_HXX
#define HLS_TAG_SESSION_DATA_HXX

#include "Enumerations.hxx"
#include "tag/DirtyLineTag.hxx"
#include "tag/LazyAttribute.hxx"
#include "tag/MaybeOwnedString.hxx"
#include "tag/Reinterpret.hxx"
#include "tag/TagName.hxx"

#include <optional>
#include <string>
#include <string_view>

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-SESSION-DATA
 */
class SessionData final : public DirtyLineTag {
	MaybeOwnedString data_id;
	LazyAttribute<std::string> value;
	LazyAttribute<std::string> uri;
	LazyAttribute<std::string> format;
	LazyAttribute<std::string> language;

public:
	static constexpr TagName NAME = TagName::SESSION_DATA;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit SessionData(const ParsedTag &tag);

	explicit SessionData(std::string _data_id);

	std::string_view GetDataId() const noexcept {
		return data_id.Get();
	}

	std::optional<std::string_view> GetValue() const noexcept {
		return value.Get<std::string_view>(GetQuotedString);
	}

	std::optional<std::string_view> GetUri() const noexcept {
		return uri.Get<std::string_view>(GetQuotedString);
	}

	/**
	 * @return the FORMAT, JSON if absent
	 */
	EnumeratedString<SessionDataFormat> GetFormat() const noexcept {
		return format.Get<EnumeratedString<SessionDataFormat>>(GetUnquotedEnumerated<SessionDataFormat>)
			.value_or(SessionDataFormat::JSON);
	}

	std::optional<std::string_view> GetLanguage() const noexcept {
		return language.Get<std::string_view>(GetQuotedString);
	}

	void SetDataId(std::string _value) noexcept {
		data_id = MaybeOwnedString{std::move(_value)};
		MarkDirty();
	}

	void SetValue(std::string _value) noexcept {
		value.Set(std::move(_value));
		MarkDirty();
	}

	void UnsetValue() noexcept {
		value.Unset();
		MarkDirty();
	}

	void SetUri(std::string _value) noexcept {
		uri.Set(std::move(_value));
		MarkDirty();
	}

	void UnsetUri() noexcept {
		uri.Unset();
		MarkDirty();
	}

	void SetFormat(EnumeratedString<SessionDataFormat> _value) {
		format.Set(std::string{_value.AsString()});
		MarkDirty();
	}

	void UnsetFormat() noexcept {
		format.Unset();
		MarkDirty();
	}

	void SetLanguage(std::string _value) noexcept {
		language.Set(std::move(_value));
		MarkDirty();
	}

	void UnsetLanguage() noexcept {
		language.Unset();
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
