// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_DEFINE_HXX
#define HLS_TAG_DEFINE_HXX

#include "tag/DirtyLineTag.hxx"
#include "tag/MaybeOwnedString.hxx"
#include "tag/TagName.hxx"

#include <cstdint>
#include <string>
#include <string_view>

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-DEFINE.  It has exactly one of three forms: NAME and VALUE
 * define a variable, IMPORT imports one from the multivariant
 * playlist, QUERYPARAM takes one from the URI query.
 */
class Define final : public DirtyLineTag {
public:
	enum class Kind : uint8_t {
		NAME,
		IMPORT,
		QUERYPARAM,
	};

private:
	Kind kind;

	/**
	 * The variable name (NAME, IMPORT or QUERYPARAM).
	 */
	MaybeOwnedString name;

	/**
	 * The VALUE; empty unless the kind is NAME.
	 */
	MaybeOwnedString value;

public:
	static constexpr TagName NAME = TagName::DEFINE;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit Define(const ParsedTag &tag);

	/**
	 * Construct a NAME/VALUE definition.
	 */
	Define(std::string _name, std::string _value);

	static Define Import(std::string _name) {
		return Define{Kind::IMPORT, std::move(_name)};
	}

	static Define Queryparam(std::string _name) {
		return Define{Kind::QUERYPARAM, std::move(_name)};
	}

	Kind GetKind() const noexcept {
		return kind;
	}

	/**
	 * The name of the variable, regardless of the kind.
	 */
	std::string_view GetName() const noexcept {
		return name.Get();
	}

	std::string_view GetValue() const noexcept {
		return value.Get();
	}

	void SetName(std::string _name, std::string _value) noexcept {
		kind = Kind::NAME;
		name = MaybeOwnedString{std::move(_name)};
		value = MaybeOwnedString{std::move(_value)};
		MarkDirty();
	}

	void SetImport(std::string _name) noexcept {
		kind = Kind::IMPORT;
		name = MaybeOwnedString{std::move(_name)};
		value = MaybeOwnedString{};
		MarkDirty();
	}

	void SetQueryparam(std::string _name) noexcept {
		kind = Kind::QUERYPARAM;
		name = MaybeOwnedString{std::move(_name)};
		value = MaybeOwnedString{};
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;

private:
	Define(Kind _kind, std::string _name);
};

} // namespace Hls

#endif
