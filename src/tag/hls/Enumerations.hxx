// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

/*
 * The known tokens of all enumerated attributes.  Each enum is
 * usable with #EnumeratedString and #EnumeratedStringList.
 */

#ifndef HLS_ENUMERATIONS_HXX
#define HLS_ENUMERATIONS_HXX

#include "tag/EnumeratedString.hxx"

#include <cstdint>
#include <optional>
#include <string_view>

namespace Hls {

/**
 * METHOD of EXT-X-KEY and EXT-X-SESSION-KEY
 */
enum class KeyMethod : uint8_t {
	NONE,
	AES_128,
	SAMPLE_AES,
	SAMPLE_AES_CTR,
};

template<>
struct EnumeratedStringTraits<KeyMethod> {
	static constexpr std::string_view names[] = {
		"NONE",
		"AES-128",
		"SAMPLE-AES",
		"SAMPLE-AES-CTR",
	};
};

/**
 * CUE of EXT-X-DATERANGE
 */
enum class Cue : uint8_t {
	PRE,
	POST,
	ONCE,
};

template<>
struct EnumeratedStringTraits<Cue> {
	static constexpr std::string_view names[] = {
		"PRE",
		"POST",
		"ONCE",
	};
};

/**
 * TYPE of EXT-X-PRELOAD-HINT
 */
enum class PreloadHintType : uint8_t {
	PART,
	MAP,
};

template<>
struct EnumeratedStringTraits<PreloadHintType> {
	static constexpr std::string_view names[] = {
		"PART",
		"MAP",
	};
};

/**
 * TYPE of EXT-X-MEDIA
 */
enum class MediaType : uint8_t {
	AUDIO,
	VIDEO,
	SUBTITLES,
	CLOSED_CAPTIONS,
};

template<>
struct EnumeratedStringTraits<MediaType> {
	static constexpr std::string_view names[] = {
		"AUDIO",
		"VIDEO",
		"SUBTITLES",
		"CLOSED-CAPTIONS",
	};
};

/**
 * INSTREAM-ID of EXT-X-MEDIA; only the CEA-608 channels are
 * enumerated, see GetCea708ServiceNumber() for the others.
 */
enum class InstreamId : uint8_t {
	CC1,
	CC2,
	CC3,
	CC4,
};

template<>
struct EnumeratedStringTraits<InstreamId> {
	static constexpr std::string_view names[] = {
		"CC1",
		"CC2",
		"CC3",
		"CC4",
	};
};

/**
 * Interpret an INSTREAM-ID of the form "SERVICEn" (a CEA-708
 * service block number, 1..63).
 */
[[gnu::pure]]
std::optional<unsigned>
GetCea708ServiceNumber(const EnumeratedString<InstreamId> &id) noexcept;

/**
 * CHARACTERISTICS of EXT-X-MEDIA
 */
enum class MediaCharacteristic : uint8_t {
	TRANSCRIBES_SPOKEN_DIALOG,
	DESCRIBES_MUSIC_AND_SOUND,
	EASY_TO_READ,
	DESCRIBES_VIDEO,
	MACHINE_GENERATED,
};

template<>
struct EnumeratedStringTraits<MediaCharacteristic> {
	static constexpr std::string_view names[] = {
		"public.accessibility.transcribes-spoken-dialog",
		"public.accessibility.describes-music-and-sound",
		"public.easy-to-read",
		"public.accessibility.describes-video",
		"public.machine-generated",
	};
};

/**
 * HDCP-LEVEL of EXT-X-STREAM-INF and EXT-X-I-FRAME-STREAM-INF
 */
enum class HdcpLevel : uint8_t {
	NONE,
	TYPE_0,
	TYPE_1,
};

template<>
struct EnumeratedStringTraits<HdcpLevel> {
	static constexpr std::string_view names[] = {
		"NONE",
		"TYPE-0",
		"TYPE-1",
	};
};

/**
 * VIDEO-RANGE of EXT-X-STREAM-INF and EXT-X-I-FRAME-STREAM-INF
 */
enum class VideoRange : uint8_t {
	SDR,
	HLG,
	PQ,
};

template<>
struct EnumeratedStringTraits<VideoRange> {
	static constexpr std::string_view names[] = {
		"SDR",
		"HLG",
		"PQ",
	};
};

/**
 * FORMAT of EXT-X-SESSION-DATA
 */
enum class SessionDataFormat : uint8_t {
	JSON,
	RAW,
};

template<>
struct EnumeratedStringTraits<SessionDataFormat> {
	static constexpr std::string_view names[] = {
		"JSON",
		"RAW",
	};
};

} // namespace Hls

#endif
