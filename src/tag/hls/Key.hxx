// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_KEY_HXX
#define HLS_TAG_KEY_HXX

#include "Enumerations.hxx"
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
 * The implied KEYFORMAT if the attribute is absent.
 */
constexpr std::string_view DEFAULT_KEYFORMAT = "identity";

/**
 * EXT-X-KEY
 */
class Key final : public DirtyLineTag {
	MaybeOwnedString method;
	LazyAttribute<std::string> uri;
	LazyAttribute<std::string> iv;
	LazyAttribute<std::string> keyformat;
	LazyAttribute<std::string> keyformatversions;

public:
	static constexpr TagName NAME = TagName::KEY;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit Key(const ParsedTag &tag);

	explicit Key(EnumeratedString<KeyMethod> _method);

	EnumeratedString<KeyMethod> GetMethod() const noexcept {
		return EnumeratedString<KeyMethod>{method.Get()};
	}

	std::optional<std::string_view> GetUri() const noexcept {
		return uri.Get<std::string_view>(GetQuotedString);
	}

	/**
	 * The initialization vector as hexadecimal-sequence, e.g.
	 * "0x0123...".
	 */
	std::optional<std::string_view> GetIv() const noexcept {
		return iv.Get<std::string_view>(GetUnquotedString);
	}

	std::string_view GetKeyformat() const noexcept {
		return keyformat.Get<std::string_view>(GetQuotedString)
			.value_or(DEFAULT_KEYFORMAT);
	}

	std::optional<std::string_view> GetKeyformatversions() const noexcept {
		return keyformatversions.Get<std::string_view>(GetQuotedString);
	}

	void SetMethod(EnumeratedString<KeyMethod> _method) {
		method = MaybeOwnedString{std::string{_method.AsString()}};
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

	void SetIv(std::string value) noexcept {
		iv.Set(std::move(value));
		MarkDirty();
	}

	void UnsetIv() noexcept {
		iv.Unset();
		MarkDirty();
	}

	void SetKeyformat(std::string value) noexcept {
		keyformat.Set(std::move(value));
		MarkDirty();
	}

	void UnsetKeyformat() noexcept {
		keyformat.Unset();
		MarkDirty();
	}

	void SetKeyformatversions(std::string value) noexcept {
		keyformatversions.Set(std::move(value));
		MarkDirty();
	}

	void UnsetKeyformatversions() noexcept {
		keyformatversions.Unset();
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
