// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "TagName.hxx"

#include <cstdint>

namespace Hls {

class TagNameMask {
	using mask_t = uint_least64_t;

	/* the mask must have enough bits to represent all tag
	   names */
	static_assert(NUM_TAG_NAMES <= sizeof(mask_t) * 8);

	mask_t value;

	explicit constexpr TagNameMask(mask_t _value) noexcept
		:value(_value) {}

public:
	TagNameMask() = default;

	constexpr TagNameMask(TagName name) noexcept
		:value(mask_t(1) << mask_t(name)) {}

	static constexpr TagNameMask None() noexcept {
		return TagNameMask(mask_t(0));
	}

	static constexpr TagNameMask All() noexcept {
		return TagNameMask((mask_t(1) << NUM_TAG_NAMES) - 1);
	}

	constexpr TagNameMask operator~() const noexcept {
		return TagNameMask(~value) & All();
	}

	constexpr TagNameMask operator&(TagNameMask other) const noexcept {
		return TagNameMask(value & other.value);
	}

	constexpr TagNameMask operator|(TagNameMask other) const noexcept {
		return TagNameMask(value | other.value);
	}

	TagNameMask &operator&=(TagNameMask other) noexcept {
		value &= other.value;
		return *this;
	}

	TagNameMask &operator|=(TagNameMask other) noexcept {
		value |= other.value;
		return *this;
	}

	constexpr bool operator==(const TagNameMask &) const noexcept = default;

	constexpr bool TestAny() const noexcept {
		return value != 0;
	}

	constexpr bool Test(TagName name) const noexcept {
		return (*this & name).TestAny();
	}

	void Set(TagName name) noexcept {
		*this |= name;
	}

	void Unset(TagName name) noexcept {
		*this &= ~TagNameMask(name);
	}
};

} // namespace Hls
