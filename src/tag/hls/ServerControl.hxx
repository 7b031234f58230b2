// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_SERVER_CONTROL_HXX
#define HLS_TAG_SERVER_CONTROL_HXX

#include "tag/DirtyLineTag.hxx"
#include "tag/LazyAttribute.hxx"
#include "tag/TagName.hxx"

#include <optional>

namespace Hls {

struct ParsedTag;

/**
 * EXT-X-SERVER-CONTROL.  All attributes are optional.
 */
class ServerControl final : public DirtyLineTag {
	LazyAttribute<double> can_skip_until;
	LazyAttribute<bool> can_skip_dateranges;
	LazyAttribute<double> hold_back;
	LazyAttribute<double> part_hold_back;
	LazyAttribute<bool> can_block_reload;

public:
	static constexpr TagName NAME = TagName::SERVER_CONTROL;

	/**
	 * Throws #ValidationError on error.
	 */
	explicit ServerControl(const ParsedTag &tag);

	/**
	 * Construct an instance without attributes; use the setters
	 * to fill it.
	 */
	ServerControl();

	std::optional<double> GetCanSkipUntil() const noexcept {
		return can_skip_until.Get(GetDecimalFloat);
	}

	bool CanSkipDateranges() const noexcept {
		return can_skip_dateranges.Get(GetYesNo).value_or(false);
	}

	std::optional<double> GetHoldBack() const noexcept {
		return hold_back.Get(GetDecimalFloat);
	}

	std::optional<double> GetPartHoldBack() const noexcept {
		return part_hold_back.Get(GetDecimalFloat);
	}

	bool CanBlockReload() const noexcept {
		return can_block_reload.Get(GetYesNo).value_or(false);
	}

	void SetCanSkipUntil(double value) noexcept {
		can_skip_until.Set(value);
		MarkDirty();
	}

	void UnsetCanSkipUntil() noexcept {
		can_skip_until.Unset();
		MarkDirty();
	}

	void SetCanSkipDateranges(bool value) noexcept {
		can_skip_dateranges.Set(value);
		MarkDirty();
	}

	void UnsetCanSkipDateranges() noexcept {
		can_skip_dateranges.Unset();
		MarkDirty();
	}

	void SetHoldBack(double value) noexcept {
		hold_back.Set(value);
		MarkDirty();
	}

	void UnsetHoldBack() noexcept {
		hold_back.Unset();
		MarkDirty();
	}

	void SetPartHoldBack(double value) noexcept {
		part_hold_back.Set(value);
		MarkDirty();
	}

	void UnsetPartHoldBack() noexcept {
		part_hold_back.Unset();
		MarkDirty();
	}

	void SetCanBlockReload(bool value) noexcept {
		can_block_reload.Set(value);
		MarkDirty();
	}

	void UnsetCanBlockReload() noexcept {
		can_block_reload.Unset();
		MarkDirty();
	}

protected:
	std::string CalculateLine() const override;
};

} // namespace Hls

#endif
