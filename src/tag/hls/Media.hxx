// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_MEDIA_HXX
#define HLS_TAG_MEDIA_HXX

#include "Enumerations.hxx"
#include "tag/DirtyLineTag.hxx"
#include "tag/EnumeratedStringList.hxx"
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
 * EXT-X-MEDIA
 */
class Media final : public DirtyLineTag {
	MaybeOwnedString type;
	MaybeOwnedString name;
	MaybeOwnedString group_id;
	LazyAttribute<std::string> uri;
	LazyAttribute<std::string> language;
	LazyAttribute<std::string> assoc_language;
	LazyAttribute<std::string> stable_rendition_id;
	LazyAttribute<bool> default_;
	LazyAttribute<bool> autoselect;
	LazyAttribute<bool> forced;
	LazyAttribute<std::string> instream_id;
	LazyAttribute<uint64_t> bit_depth;
	LazyAttribute<uint64_t> sample_rate;
	LazyAttribute<std::string> characteristics;
	LazyAttribute<std::string> channels;

public:
	static constexpr TagName NAME = TagName::MEDIA;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit Media(const ParsedTag &tag);

	Media(EnumeratedString<MediaType> _type,
	      std::string _name, std::string _group_id);

	EnumeratedString<MediaType> GetType() const noexcept {
		return EnumeratedString<MediaType>{type.Get()};
	}

	std::string_view GetName() const noexcept {
		return name.Get();
	}

	std::string_view GetGroupId() const noexcept {
		return group_id.Get();
	}

	std::optional<std::string_view> GetUri() const noexcept {
		return uri.Get<std::string_view>(GetQuotedString);
	}

	std::optional<std::string_view> GetLanguage() const noexcept {
		return language.Get<std::string_view>(GetQuotedString);
	}

	std::optional<std::string_view> GetAssocLanguage() const noexcept {
		return assoc_language.Get<std::string_view>(GetQuotedString);
	}

	std::optional<std::string_view> GetStableRenditionId() const noexcept {
		return stable_rendition_id.Get<std::string_view>(GetQuotedString);
	}

	bool IsDefault() const noexcept {
		return default_.Get(GetYesNo).value_or(false);
	}

	bool IsAutoselect() const noexcept {
		return autoselect.Get(GetYesNo).value_or(false);
	}

	bool IsForced() const noexcept {
		return forced.Get(GetYesNo).value_or(false);
	}

	std::optional<EnumeratedString<InstreamId>> GetInstreamId() const noexcept;

	std::optional<uint64_t> GetBitDepth() const noexcept {
		return bit_depth.Get(GetDecimalInteger);
	}

	std::optional<uint64_t> GetSampleRate() const noexcept {
		return sample_rate.Get(GetDecimalInteger);
	}

	std::optional<EnumeratedStringList<MediaCharacteristic>> GetCharacteristics() const noexcept;

	/**
	 * The CHANNELS parameter list, e.g. "6/-/BED-4".
	 */
	std::optional<std::string_view> GetChannels() const noexcept {
		return channels.Get<std::string_view>(GetQuotedString);
	}

	void SetType(EnumeratedString<MediaType> value) {
		type = MaybeOwnedString{std::string{value.AsString()}};
		MarkDirty();
	}

	void SetName(std::string value) noexcept {
		name = MaybeOwnedString{std::move(value)};
		MarkDirty();
	}

	void SetGroupId(std::string value) noexcept {
		group_id = MaybeOwnedString{std::move(value)};
		MarkDirty();
	}

	void SetUri(std::string value) noexcept {
		uri.Set(std::move(value));
		MarkDirty();
	}

	void UnsetUri() noexcept {
		uri.Unset();
		MarkDirty();
	}

	void SetLanguage(std::string value) noexcept {
		language.Set(std::move(value));
		MarkDirty();
	}

	void UnsetLanguage() noexcept {
		language.Unset();
		MarkDirty();
	}

	void SetAssocLanguage(std::string value) noexcept {
		assoc_language.Set(std::move(value));
		MarkDirty();
	}

	void UnsetAssocLanguage() noexcept {
		assoc_language.Unset();
		MarkDirty();
	}

	void SetStableRenditionId(std::string value) noexcept {
		stable_rendition_id.Set(std::move(value));
		MarkDirty();
	}

	void UnsetStableRenditionId() noexcept {
		stable_rendition_id.Unset();
		MarkDirty();
	}

	void SetDefault(bool value) noexcept {
		default_.Set(value);
		MarkDirty();
	}

	void UnsetDefault() noexcept {
		default_.Unset();
		MarkDirty();
	}

	void SetAutoselect(bool value) noexcept {
		autoselect.Set(value);
		MarkDirty();
	}

	void UnsetAutoselect() noexcept {
		autoselect.Unset();
		MarkDirty();
	}

	void SetForced(bool value) noexcept {
		forced.Set(value);
		MarkDirty();
	}

	void UnsetForced() noexcept {
		forced.Unset();
		MarkDirty();
	}

	void SetInstreamId(EnumeratedString<InstreamId> value) {
		instream_id.Set(std::string{value.AsString()});
		MarkDirty();
	}

	void UnsetInstreamId() noexcept {
		instream_id.Unset();
		MarkDirty();
	}

	void SetBitDepth(uint64_t value) noexcept {
		bit_depth.Set(value);
		MarkDirty();
	}

	void UnsetBitDepth() noexcept {
		bit_depth.Unset();
		MarkDirty();
	}

	void SetSampleRate(uint64_t value) noexcept {
		sample_rate.Set(value);
		MarkDirty();
	}

	void UnsetSampleRate() noexcept {
		sample_rate.Unset();
		MarkDirty();
	}

	void SetCharacteristics(const EnumeratedStringList<MediaCharacteristic> &value) {
		characteristics.Set(std::string{value.AsString()});
		MarkDirty();
	}

	void UnsetCharacteristics() noexcept {
		characteristics.Unset();
		MarkDirty();
	}

	void SetChannels(std::string value) noexcept {
		channels.Set(std::move(value));
		MarkDirty();
	}

	void UnsetChannels() noexcept {
		channels.Unset();
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
