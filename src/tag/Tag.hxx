// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_TAG_HXX
#define HLS_TAG_HXX

#include "TagName.hxx"
#include "MaybeOwnedString.hxx"
#include "hls/Byterange.hxx"
#include "hls/ContentSteering.hxx"
#include "hls/Daterange.hxx"
#include "hls/Define.hxx"
#include "hls/Empty.hxx"
#include "hls/IFrameStreamInf.hxx"
#include "hls/Inf.hxx"
#include "hls/Integer.hxx"
#include "hls/Key.hxx"
#include "hls/Map.hxx"
#include "hls/Media.hxx"
#include "hls/Part.hxx"
#include "hls/PartInf.hxx"
#include "hls/PlaylistType.hxx"
#include "hls/PreloadHint.hxx"
#include "hls/ProgramDateTime.hxx"
#include "hls/RenditionReport.hxx"
#include "hls/ServerControl.hxx"
#include "hls/SessionData.hxx"
#include "hls/SessionKey.hxx"
#include "hls/Skip.hxx"
#include "hls/Start.hxx"
#include "hls/StreamInf.hxx"

#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace Hls {

struct ParsedTag;

/**
 * One record type for each #TagName, in the same order.
 */
using TagVariant = std::variant<M3u,
				Version,
				IndependentSegments,
				Start,
				Define,
				Targetduration,
				MediaSequence,
				DiscontinuitySequence,
				Endlist,
				PlaylistType,
				IFramesOnly,
				PartInf,
				ServerControl,
				Inf,
				Byterange,
				Discontinuity,
				Key,
				Map,
				ProgramDateTime,
				Gap,
				Bitrate,
				Part,
				Daterange,
				Skip,
				PreloadHint,
				RenditionReport,
				Media,
				StreamInf,
				IFrameStreamInf,
				SessionData,
				SessionKey,
				ContentSteering>;

static_assert(std::variant_size_v<TagVariant> == NUM_TAG_NAMES);

/**
 * A built-in tag: one of the typed records.
 */
class Tag {
	TagVariant value;

public:
	template<typename T>
	requires(std::is_base_of_v<DirtyLineTag, std::decay_t<T>> &&
		 std::is_constructible_v<TagVariant, T &&>)
	Tag(T &&record) noexcept(std::is_nothrow_constructible_v<TagVariant, T &&>)
		:value(std::forward<T>(record)) {}

	template<std::size_t I, typename... Args>
	explicit Tag(std::in_place_index_t<I> i, Args&&... args)
		:value(i, std::forward<Args>(args)...) {}

	TagName GetName() const noexcept {
		return TagName(value.index());
	}

	template<typename T>
	bool Is() const noexcept {
		return std::holds_alternative<T>(value);
	}

	/**
	 * @return the record if it is of the given type, nullptr
	 * otherwise
	 */
	template<typename T>
	T *Get() noexcept {
		return std::get_if<T>(&value);
	}

	template<typename T>
	const T *Get() const noexcept {
		return std::get_if<T>(&value);
	}

	/**
	 * Access the record through its common base class.
	 */
	DirtyLineTag &GetRecord() noexcept {
		return std::visit([](auto &t) -> DirtyLineTag & { return t; },
				  value);
	}

	const DirtyLineTag &GetRecord() const noexcept {
		return std::visit([](const auto &t) -> const DirtyLineTag & { return t; },
				  value);
	}

	template<typename F>
	decltype(auto) Visit(F &&f) {
		return std::visit(std::forward<F>(f), value);
	}

	template<typename F>
	decltype(auto) Visit(F &&f) const {
		return std::visit(std::forward<F>(f), value);
	}

	bool IsDirty() const noexcept {
		return GetRecord().IsDirty();
	}

	/**
	 * Finalize the output line, see DirtyLineTag::IntoInner().
	 */
	TagInner IntoInner() && {
		return std::move(GetRecord()).IntoInner();
	}

	std::string ToString() const {
		return GetRecord().ToString();
	}
};

/**
 * Construct the record for the given built-in name from a
 * tokenized tag.
 *
 * Throws #ValidationError on error.
 *
 * @param name the name; must not be TagName::UNKNOWN
 */
Tag
ParseKnownTag(TagName name, const ParsedTag &tag);

} // namespace Hls

#endif
