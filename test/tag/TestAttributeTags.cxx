// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "MakeTag.hxx"
#include "tag/hls/ContentSteering.hxx"
#include "tag/hls/Daterange.hxx"
#include "tag/hls/Define.hxx"
#include "tag/hls/IFrameStreamInf.hxx"
#include "tag/hls/Key.hxx"
#include "tag/hls/Map.hxx"
#include "tag/hls/Media.hxx"
#include "tag/hls/Part.hxx"
#include "tag/hls/PartInf.hxx"
#include "tag/hls/PreloadHint.hxx"
#include "tag/hls/RenditionReport.hxx"
#include "tag/hls/ServerControl.hxx"
#include "tag/hls/SessionData.hxx"
#include "tag/hls/SessionKey.hxx"
#include "tag/hls/Skip.hxx"
#include "tag/hls/Start.hxx"
#include "tag/hls/StreamInf.hxx"
#include "ValidationError.hxx"

#include <gtest/gtest.h>

#include <utility>

using namespace Hls;

/**
 * Construct a record and expect a #ValidationError with the given
 * code and attribute name.
 */
template<typename T>
static void
ExpectValidationError(std::string_view line, ValidationErrorCode code,
		      std::string_view attribute_name={})
{
	try {
		T{MakeParsedTag(line)};
		ADD_FAILURE() << line;
	} catch (const ValidationError &e) {
		EXPECT_EQ(e.GetCode(), code) << line;
		EXPECT_EQ(e.GetAttributeName(), attribute_name) << line;
	}
}

TEST(Start, ParseMutate)
{
	static constexpr std::string_view line =
		"#EXT-X-START:TIME-OFFSET=-12.5,PRECISE=YES";
	Start start{MakeParsedTag(line)};
	EXPECT_EQ(start.GetTimeOffset(), -12.5);
	EXPECT_TRUE(start.IsPrecise());
	EXPECT_TRUE(IsVerbatim(Start{MakeParsedTag(line)}, line));

	start.SetPrecise(false);
	EXPECT_EQ(Render(std::move(start)), "#EXT-X-START:TIME-OFFSET=-12.5");

	EXPECT_EQ(Render(Start{25}), "#EXT-X-START:TIME-OFFSET=25");
	EXPECT_EQ(Render(Start{2.5, true}),
		  "#EXT-X-START:TIME-OFFSET=2.5,PRECISE=YES");

	/* no exponent notation, even for very small values */
	EXPECT_EQ(Render(Start{0.00001}), "#EXT-X-START:TIME-OFFSET=0.00001");
	EXPECT_EQ(Render(Start{-1e-7}), "#EXT-X-START:TIME-OFFSET=-0.0000001");

	ExpectValidationError<Start>("#EXT-X-START:PRECISE=YES",
				     ValidationErrorCode::MISSING_REQUIRED_ATTRIBUTE,
				     "TIME-OFFSET");
	ExpectValidationError<Start>("#EXT-X-START:TIME-OFFSET=\"1\"",
				     ValidationErrorCode::ERROR_EXTRACTING_ATTRIBUTE_LIST_VALUE,
				     "TIME-OFFSET");
	ExpectValidationError<Start>("#EXT-X-START:12",
				     ValidationErrorCode::UNEXPECTED_VALUE_TYPE);
}

TEST(Define, Parse)
{
	Define define{MakeParsedTag("#EXT-X-DEFINE:NAME=\"base\",VALUE=\"https://example.com\"")};
	EXPECT_EQ(define.GetKind(), Define::Kind::NAME);
	EXPECT_EQ(define.GetName(), "base");
	EXPECT_EQ(define.GetValue(), "https://example.com");

	define.SetImport("token");
	EXPECT_EQ(define.GetKind(), Define::Kind::IMPORT);
	EXPECT_EQ(Render(std::move(define)), "#EXT-X-DEFINE:IMPORT=\"token\"");

	Define q{MakeParsedTag("#EXT-X-DEFINE:QUERYPARAM=\"session\"")};
	EXPECT_EQ(q.GetKind(), Define::Kind::QUERYPARAM);
	EXPECT_EQ(q.GetName(), "session");

	EXPECT_EQ(Render(Define::Import("x")), "#EXT-X-DEFINE:IMPORT=\"x\"");
	EXPECT_EQ(Render(Define{"a", "b"}), "#EXT-X-DEFINE:NAME=\"a\",VALUE=\"b\"");

	ExpectValidationError<Define>("#EXT-X-DEFINE:FOO=\"x\"",
				      ValidationErrorCode::MISSING_REQUIRED_ATTRIBUTE,
				      "NAME");
	ExpectValidationError<Define>("#EXT-X-DEFINE:NAME=\"x\"",
				      ValidationErrorCode::MISSING_REQUIRED_ATTRIBUTE,
				      "VALUE");
}

TEST(PartInf, ParseMutate)
{
	PartInf part_inf{MakeParsedTag("#EXT-X-PART-INF:PART-TARGET=1.004")};
	EXPECT_EQ(part_inf.GetPartTarget(), 1.004);

	part_inf.SetPartTarget(0.5);
	EXPECT_EQ(Render(std::move(part_inf)), "#EXT-X-PART-INF:PART-TARGET=0.5");
}

TEST(ServerControl, ParseMutate)
{
	ServerControl sc{MakeParsedTag("#EXT-X-SERVER-CONTROL:CAN-BLOCK-RELOAD=YES,PART-HOLD-BACK=3.012,CAN-SKIP-UNTIL=36")};
	EXPECT_TRUE(sc.CanBlockReload());
	EXPECT_FALSE(sc.CanSkipDateranges());
	EXPECT_EQ(sc.GetPartHoldBack(), 3.012);
	EXPECT_EQ(sc.GetCanSkipUntil(), 36.0);
	EXPECT_FALSE(sc.GetHoldBack());

	sc.SetHoldBack(12);
	EXPECT_EQ(Render(std::move(sc)),
		  "#EXT-X-SERVER-CONTROL:CAN-SKIP-UNTIL=36,HOLD-BACK=12,PART-HOLD-BACK=3.012,CAN-BLOCK-RELOAD=YES");

	ServerControl empty;
	EXPECT_EQ(empty.ToString(), "#EXT-X-SERVER-CONTROL");
	empty.SetCanSkipDateranges(true);
	empty.SetCanSkipUntil(24);
	EXPECT_EQ(Render(std::move(empty)),
		  "#EXT-X-SERVER-CONTROL:CAN-SKIP-UNTIL=24,CAN-SKIP-DATERANGES=YES");
}

TEST(Key, ParseMutate)
{
	static constexpr std::string_view line =
		"#EXT-X-KEY:METHOD=AES-128,URI=\"key.bin\",IV=0x0123456789abcdef0123456789abcdef";
	Key key{MakeParsedTag(line)};
	EXPECT_EQ(key.GetMethod(), KeyMethod::AES_128);
	EXPECT_EQ(key.GetUri(), std::string_view{"key.bin"});
	EXPECT_EQ(key.GetIv(), std::string_view{"0x0123456789abcdef0123456789abcdef"});
	EXPECT_EQ(key.GetKeyformat(), "identity");
	EXPECT_FALSE(key.GetKeyformatversions());
	EXPECT_EQ(key.ToString(), line);

	key.SetKeyformat("com.apple.streamingkeydelivery");
	EXPECT_EQ(key.ToString(),
		  "#EXT-X-KEY:METHOD=AES-128,URI=\"key.bin\",IV=0x0123456789abcdef0123456789abcdef,KEYFORMAT=\"com.apple.streamingkeydelivery\"");

	/* the default comes back after unsetting */
	key.UnsetKeyformat();
	EXPECT_EQ(key.GetKeyformat(), "identity");

	/* the default is not written */
	key.SetKeyformat("identity");
	key.UnsetIv();
	EXPECT_EQ(Render(std::move(key)),
		  "#EXT-X-KEY:METHOD=AES-128,URI=\"key.bin\"");

	EXPECT_EQ(Render(Key{KeyMethod::NONE}), "#EXT-X-KEY:METHOD=NONE");

	ExpectValidationError<Key>("#EXT-X-KEY:URI=\"key.bin\"",
				   ValidationErrorCode::MISSING_REQUIRED_ATTRIBUTE,
				   "METHOD");
}

TEST(Key, UnknownMethod)
{
	Key key{MakeParsedTag("#EXT-X-KEY:METHOD=AES-256,URI=\"k\"")};
	EXPECT_FALSE(key.GetMethod().IsKnown());
	EXPECT_EQ(key.GetMethod().AsString(), "AES-256");

	key.SetUri("other");
	EXPECT_EQ(Render(std::move(key)), "#EXT-X-KEY:METHOD=AES-256,URI=\"other\"");
}

/* setters which copy an enumerated string into an owned buffer may
   throw std::bad_alloc */
static_assert(!noexcept(std::declval<Key &>().SetMethod(KeyMethod::NONE)));
static_assert(!noexcept(std::declval<SessionKey &>().SetMethod(KeyMethod::NONE)));
static_assert(!noexcept(std::declval<Media &>().SetType(MediaType::AUDIO)));
static_assert(!noexcept(std::declval<PreloadHint &>().SetType(PreloadHintType::PART)));

TEST(Key, SetMethod)
{
	Key key{MakeParsedTag("#EXT-X-KEY:METHOD=AES-128,URI=\"k\"")};
	key.SetMethod(EnumeratedString<KeyMethod>{"AES-256"});
	EXPECT_FALSE(key.GetMethod().IsKnown());
	EXPECT_EQ(Render(std::move(key)), "#EXT-X-KEY:METHOD=AES-256,URI=\"k\"");
}

TEST(SessionKey, ParseMutate)
{
	SessionKey key{MakeParsedTag("#EXT-X-SESSION-KEY:METHOD=SAMPLE-AES,URI=\"skd://key\",KEYFORMAT=\"com.apple.streamingkeydelivery\",KEYFORMATVERSIONS=\"1\"")};
	EXPECT_EQ(key.GetMethod(), KeyMethod::SAMPLE_AES);
	EXPECT_EQ(key.GetUri(), "skd://key");
	EXPECT_EQ(key.GetKeyformat(), "com.apple.streamingkeydelivery");
	EXPECT_EQ(key.GetKeyformatversions(), std::string_view{"1"});

	key.UnsetKeyformatversions();
	key.SetIv("0x1");
	EXPECT_EQ(Render(std::move(key)),
		  "#EXT-X-SESSION-KEY:METHOD=SAMPLE-AES,URI=\"skd://key\",IV=0x1,KEYFORMAT=\"com.apple.streamingkeydelivery\"");

	ExpectValidationError<SessionKey>("#EXT-X-SESSION-KEY:METHOD=SAMPLE-AES",
					  ValidationErrorCode::MISSING_REQUIRED_ATTRIBUTE,
					  "URI");
}

TEST(Map, ParseMutate)
{
	Map map{MakeParsedTag("#EXT-X-MAP:URI=\"init.mp4\",BYTERANGE=\"720@0\"")};
	EXPECT_EQ(map.GetUri(), "init.mp4");
	EXPECT_EQ(map.GetByterange(), (DecimalIntegerRange{720, 0}));

	map.SetByterange(1000, 50);
	EXPECT_EQ(map.ToString(),
		  "#EXT-X-MAP:URI=\"init.mp4\",BYTERANGE=\"1000@50\"");

	map.UnsetByterange();
	EXPECT_FALSE(map.GetByterange());
	EXPECT_EQ(Render(std::move(map)), "#EXT-X-MAP:URI=\"init.mp4\"");

	/* a missing offset means 0 */
	Map no_offset{MakeParsedTag("#EXT-X-MAP:URI=\"init.mp4\",BYTERANGE=\"720\"")};
	EXPECT_EQ(no_offset.GetByterange(), (DecimalIntegerRange{720, 0}));

	/* a malformed optional attribute reads as absent */
	Map malformed{MakeParsedTag("#EXT-X-MAP:URI=\"init.mp4\",BYTERANGE=720")};
	EXPECT_FALSE(malformed.GetByterange());

	ExpectValidationError<Map>("#EXT-X-MAP:URI=init",
				   ValidationErrorCode::ERROR_EXTRACTING_ATTRIBUTE_LIST_VALUE,
				   "URI");
}

TEST(Part, ParseMutate)
{
	Part part{MakeParsedTag("#EXT-X-PART:DURATION=0.33334,URI=\"part1.mp4\",INDEPENDENT=YES,BYTERANGE=\"1000@200\"")};
	EXPECT_EQ(part.GetUri(), "part1.mp4");
	EXPECT_EQ(part.GetDuration(), 0.33334);
	EXPECT_TRUE(part.IsIndependent());
	EXPECT_FALSE(part.IsGap());
	EXPECT_EQ(part.GetByterange(), (DecimalIntegerRange{1000, 200}));

	part.SetGap(true);
	EXPECT_EQ(part.ToString(),
		  "#EXT-X-PART:URI=\"part1.mp4\",DURATION=0.33334,INDEPENDENT=YES,BYTERANGE=\"1000@200\",GAP=YES");

	part.SetByterange({500, std::nullopt});
	part.UnsetIndependent();
	EXPECT_EQ(Render(std::move(part)),
		  "#EXT-X-PART:URI=\"part1.mp4\",DURATION=0.33334,BYTERANGE=\"500\",GAP=YES");

	EXPECT_EQ(Render(Part{"p.mp4", 1}), "#EXT-X-PART:URI=\"p.mp4\",DURATION=1");
}

TEST(Daterange, ParseMutate)
{
	Daterange daterange{MakeParsedTag("#EXT-X-DATERANGE:ID=\"splice-6FFFFFF0\",START-DATE=\"2014-03-05T11:15:00Z\",PLANNED-DURATION=59.993,SCTE35-OUT=0xFC002F,X-COM-EXAMPLE-AD-ID=\"XYZ123\",X-COUNT=3,CUE=\"PRE,ONCE\",X-COUNT=4")};
	EXPECT_EQ(daterange.GetId(), "splice-6FFFFFF0");
	EXPECT_EQ(daterange.GetStartDate().year, 2014u);
	EXPECT_EQ(daterange.GetStartDate().minute, 15u);
	EXPECT_EQ(daterange.GetPlannedDuration(), 59.993);
	EXPECT_FALSE(daterange.GetDuration());
	EXPECT_FALSE(daterange.GetEndDate());
	EXPECT_FALSE(daterange.GetClass());
	EXPECT_EQ(daterange.GetScte35Out(), std::string_view{"0xFC002F"});
	EXPECT_FALSE(daterange.IsEndOnNext());

	const auto cue = daterange.GetCue();
	ASSERT_TRUE(cue);
	EXPECT_EQ(cue->size(), 2u);
	EXPECT_TRUE(cue->Contains(Cue::PRE));
	EXPECT_TRUE(cue->Contains(Cue::ONCE));
	EXPECT_FALSE(cue->Contains(Cue::POST));

	/* the first occurrence of an attribute wins */
	EXPECT_EQ(daterange.GetClientAttributes().size(), 2u);
	const auto *count = daterange.GetClientAttribute("X-COUNT");
	ASSERT_NE(count, nullptr);
	EXPECT_EQ(*count, WritableAttributeValue{uint64_t{3}});

	const auto *ad_id = daterange.GetClientAttribute("X-COM-EXAMPLE-AD-ID");
	ASSERT_NE(ad_id, nullptr);
	EXPECT_EQ(*ad_id, WritableAttributeValue{WritableQuotedString{"XYZ123"}});

	daterange.SetClass("com.example");
	daterange.UnsetClientAttribute("X-COUNT");
	daterange.SetClientAttribute("X-NEW", WritableQuotedString{"v"});
	daterange.SetEndOnNext(true);
	EXPECT_EQ(Render(std::move(daterange)),
		  "#EXT-X-DATERANGE:ID=\"splice-6FFFFFF0\",START-DATE=\"2014-03-05T11:15:00.000Z\",CLASS=\"com.example\",CUE=\"PRE,ONCE\",PLANNED-DURATION=59.993,X-COM-EXAMPLE-AD-ID=\"XYZ123\",X-NEW=\"v\",SCTE35-OUT=0xFC002F,END-ON-NEXT=YES");
}

TEST(Daterange, Construct)
{
	DateTime start;
	start.year = 2025;
	start.month = 6;
	start.day = 4;

	Daterange daterange{"ad", start};
	EXPECT_FALSE(daterange.IsDirty());
	EXPECT_EQ(daterange.ToString(),
		  "#EXT-X-DATERANGE:ID=\"ad\",START-DATE=\"2025-06-04T00:00:00.000Z\"");

	daterange.SetCue({Cue::POST});
	daterange.SetDuration(30);
	daterange.SetEndDate(start);
	EXPECT_EQ(Render(std::move(daterange)),
		  "#EXT-X-DATERANGE:ID=\"ad\",START-DATE=\"2025-06-04T00:00:00.000Z\",CUE=\"POST\",END-DATE=\"2025-06-04T00:00:00.000Z\",DURATION=30");
}

TEST(Daterange, Errors)
{
	ExpectValidationError<Daterange>("#EXT-X-DATERANGE:START-DATE=\"2014-03-05T11:15:00Z\"",
					 ValidationErrorCode::MISSING_REQUIRED_ATTRIBUTE,
					 "ID");
	ExpectValidationError<Daterange>("#EXT-X-DATERANGE:ID=\"x\",START-DATE=\"yesterday\"",
					 ValidationErrorCode::ERROR_EXTRACTING_ATTRIBUTE_LIST_VALUE,
					 "START-DATE");
}

TEST(Skip, ParseMutate)
{
	Skip skip{MakeParsedTag("#EXT-X-SKIP:SKIPPED-SEGMENTS=3,RECENTLY-REMOVED-DATERANGES=\"one\"")};
	EXPECT_EQ(skip.GetSkippedSegments(), 3u);
	EXPECT_EQ(skip.GetRecentlyRemovedDateranges(), std::string_view{"one"});

	skip.UnsetRecentlyRemovedDateranges();
	skip.SetSkippedSegments(4);
	EXPECT_EQ(Render(std::move(skip)), "#EXT-X-SKIP:SKIPPED-SEGMENTS=4");
}

TEST(PreloadHint, ParseMutate)
{
	PreloadHint hint{MakeParsedTag("#EXT-X-PRELOAD-HINT:TYPE=PART,URI=\"part3.mp4\",BYTERANGE-START=100")};
	EXPECT_EQ(hint.GetType(), PreloadHintType::PART);
	EXPECT_EQ(hint.GetUri(), "part3.mp4");
	EXPECT_EQ(hint.GetByterangeStart(), 100u);
	EXPECT_FALSE(hint.GetByterangeLength());

	/* the default comes back after unsetting */
	hint.UnsetByterangeStart();
	EXPECT_EQ(hint.GetByterangeStart(), 0u);

	hint.SetByterangeLength(500);
	EXPECT_EQ(Render(std::move(hint)),
		  "#EXT-X-PRELOAD-HINT:TYPE=PART,URI=\"part3.mp4\",BYTERANGE-LENGTH=500");

	EXPECT_EQ(Render(PreloadHint{PreloadHintType::MAP, "init.mp4"}),
		  "#EXT-X-PRELOAD-HINT:TYPE=MAP,URI=\"init.mp4\"");
}

TEST(RenditionReport, ParseMutate)
{
	RenditionReport report{MakeParsedTag("#EXT-X-RENDITION-REPORT:URI=\"../1M/waitForMSN.php\",LAST-MSN=273,LAST-PART=2")};
	EXPECT_EQ(report.GetUri(), "../1M/waitForMSN.php");
	EXPECT_EQ(report.GetLastMsn(), 273u);
	EXPECT_EQ(report.GetLastPart(), 2u);

	report.SetLastMsn(274);
	report.UnsetLastPart();
	EXPECT_EQ(Render(std::move(report)),
		  "#EXT-X-RENDITION-REPORT:URI=\"../1M/waitForMSN.php\",LAST-MSN=274");
}

TEST(ContentSteering, ParseMutate)
{
	ContentSteering steering{MakeParsedTag("#EXT-X-CONTENT-STEERING:SERVER-URI=\"/steering?video=00012\",PATHWAY-ID=\"CDN\"")};
	EXPECT_EQ(steering.GetServerUri(), "/steering?video=00012");
	EXPECT_EQ(steering.GetPathwayId(), std::string_view{"CDN"});

	steering.SetPathwayId("CDN-B");
	EXPECT_EQ(Render(std::move(steering)),
		  "#EXT-X-CONTENT-STEERING:SERVER-URI=\"/steering?video=00012\",PATHWAY-ID=\"CDN-B\"");
}

TEST(SessionData, ParseMutate)
{
	SessionData data{MakeParsedTag("#EXT-X-SESSION-DATA:DATA-ID=\"com.example.title\",VALUE=\"This is an example\",LANGUAGE=\"en\"")};
	EXPECT_EQ(data.GetDataId(), "com.example.title");
	EXPECT_EQ(data.GetValue(), std::string_view{"This is an example"});
	EXPECT_EQ(data.GetFormat(), SessionDataFormat::JSON);

	data.SetFormat(SessionDataFormat::RAW);
	EXPECT_EQ(data.ToString(),
		  "#EXT-X-SESSION-DATA:DATA-ID=\"com.example.title\",VALUE=\"This is an example\",FORMAT=RAW,LANGUAGE=\"en\"");

	data.UnsetFormat();
	EXPECT_EQ(data.GetFormat(), SessionDataFormat::JSON);
	EXPECT_EQ(Render(std::move(data)),
		  "#EXT-X-SESSION-DATA:DATA-ID=\"com.example.title\",VALUE=\"This is an example\",LANGUAGE=\"en\"");
}

TEST(Media, ParseMutate)
{
	static constexpr std::string_view line =
		"#EXT-X-MEDIA:TYPE=AUDIO,GROUP-ID=\"aac\",NAME=\"English\",DEFAULT=YES,AUTOSELECT=YES,LANGUAGE=\"en\",URI=\"audio/en.m3u8\"";
	Media media{MakeParsedTag(line)};
	EXPECT_EQ(media.GetType(), MediaType::AUDIO);
	EXPECT_EQ(media.GetName(), "English");
	EXPECT_EQ(media.GetGroupId(), "aac");
	EXPECT_EQ(media.GetLanguage(), std::string_view{"en"});
	EXPECT_TRUE(media.IsDefault());
	EXPECT_TRUE(media.IsAutoselect());
	EXPECT_FALSE(media.IsForced());
	EXPECT_FALSE(media.GetInstreamId());
	EXPECT_EQ(media.ToString(), line);

	media.SetName("Deutsch");
	media.SetLanguage("de");
	EXPECT_EQ(Render(std::move(media)),
		  "#EXT-X-MEDIA:TYPE=AUDIO,NAME=\"Deutsch\",GROUP-ID=\"aac\",URI=\"audio/en.m3u8\",LANGUAGE=\"de\",DEFAULT=YES,AUTOSELECT=YES");
}

/**
 * After one setter, the rendered line parses back to a record where
 * only that field changed.
 */
TEST(Media, MutateReparse)
{
	static constexpr std::string_view line =
		"#EXT-X-MEDIA:TYPE=AUDIO,GROUP-ID=\"aac\",NAME=\"English\",DEFAULT=YES,LANGUAGE=\"en\",BIT-DEPTH=16,CHANNELS=\"2\"";

	using Mutation = void(*)(Media &);
	static constexpr Mutation mutations[] = {
		[](Media &m){ m.SetName("Deutsch"); },
		[](Media &m){ m.SetGroupId("opus"); },
		[](Media &m){ m.SetDefault(false); },
		[](Media &m){ m.SetForced(true); },
		[](Media &m){ m.SetBitDepth(24); },
		[](Media &m){ m.UnsetLanguage(); },
		[](Media &m){ m.SetChannels("6"); },
	};

	const Media original{MakeParsedTag(line)};

	for (const auto mutate : mutations) {
		Media expected{MakeParsedTag(line)};
		mutate(expected);

		Media copy{MakeParsedTag(line)};
		mutate(copy);
		const auto rendered = Render(std::move(copy));
		const Media reparsed{MakeParsedTag(rendered)};

		EXPECT_EQ(reparsed.GetType(), expected.GetType()) << rendered;
		EXPECT_EQ(reparsed.GetName(), expected.GetName()) << rendered;
		EXPECT_EQ(reparsed.GetGroupId(), expected.GetGroupId()) << rendered;
		EXPECT_EQ(reparsed.GetLanguage(), expected.GetLanguage()) << rendered;
		EXPECT_EQ(reparsed.IsDefault(), expected.IsDefault()) << rendered;
		EXPECT_EQ(reparsed.IsForced(), expected.IsForced()) << rendered;
		EXPECT_EQ(reparsed.GetBitDepth(), expected.GetBitDepth()) << rendered;
		EXPECT_EQ(reparsed.GetChannels(), expected.GetChannels()) << rendered;
		EXPECT_EQ(reparsed.GetUri(), original.GetUri()) << rendered;
	}
}

TEST(Media, ClosedCaptions)
{
	Media media{MakeParsedTag("#EXT-X-MEDIA:TYPE=CLOSED-CAPTIONS,GROUP-ID=\"cc\",NAME=\"CC\",INSTREAM-ID=\"SERVICE3\",CHARACTERISTICS=\"public.accessibility.transcribes-spoken-dialog,public.easy-to-read\"")};
	EXPECT_EQ(media.GetType(), MediaType::CLOSED_CAPTIONS);

	const auto id = media.GetInstreamId();
	ASSERT_TRUE(id);
	EXPECT_FALSE(id->IsKnown());
	EXPECT_EQ(GetCea708ServiceNumber(*id), 3u);

	auto characteristics = media.GetCharacteristics();
	ASSERT_TRUE(characteristics);
	EXPECT_EQ(characteristics->size(), 2u);
	EXPECT_TRUE(characteristics->Contains(MediaCharacteristic::EASY_TO_READ));

	characteristics->Remove(MediaCharacteristic::EASY_TO_READ);
	characteristics->Insert(MediaCharacteristic::DESCRIBES_VIDEO);
	media.SetCharacteristics(*characteristics);
	media.SetInstreamId(InstreamId::CC1);
	EXPECT_EQ(Render(std::move(media)),
		  "#EXT-X-MEDIA:TYPE=CLOSED-CAPTIONS,NAME=\"CC\",GROUP-ID=\"cc\",INSTREAM-ID=\"CC1\",CHARACTERISTICS=\"public.accessibility.transcribes-spoken-dialog,public.accessibility.describes-video\"");
}

TEST(Media, UnknownType)
{
	Media media{MakeParsedTag("#EXT-X-MEDIA:TYPE=HAPTICS,GROUP-ID=\"g\",NAME=\"n\"")};
	EXPECT_FALSE(media.GetType().IsKnown());
	EXPECT_EQ(media.GetType().AsString(), "HAPTICS");

	media.SetForced(true);
	EXPECT_EQ(Render(std::move(media)),
		  "#EXT-X-MEDIA:TYPE=HAPTICS,NAME=\"n\",GROUP-ID=\"g\",FORCED=YES");

	ExpectValidationError<Media>("#EXT-X-MEDIA:TYPE=AUDIO,NAME=\"n\"",
				     ValidationErrorCode::MISSING_REQUIRED_ATTRIBUTE,
				     "GROUP-ID");
}

TEST(StreamInf, ParseMutate)
{
	static constexpr std::string_view line =
		"#EXT-X-STREAM-INF:BANDWIDTH=1280000,AVERAGE-BANDWIDTH=1000000,CODECS=\"avc1.4d401f,mp4a.40.2\",RESOLUTION=1280x720,FRAME-RATE=29.97,HDCP-LEVEL=TYPE-0,VIDEO-RANGE=SDR,AUDIO=\"aac\",CLOSED-CAPTIONS=NONE";
	StreamInf inf{MakeParsedTag(line)};
	EXPECT_EQ(inf.GetBandwidth(), 1280000u);
	EXPECT_EQ(inf.GetAverageBandwidth(), 1000000u);
	EXPECT_EQ(inf.GetCodecs(), std::string_view{"avc1.4d401f,mp4a.40.2"});
	EXPECT_EQ(inf.GetResolution(), (DecimalResolution{1280, 720}));
	EXPECT_EQ(inf.GetFrameRate(), 29.97);
	EXPECT_EQ(inf.GetHdcpLevel(), EnumeratedString<HdcpLevel>{HdcpLevel::TYPE_0});
	EXPECT_EQ(inf.GetVideoRange(), EnumeratedString<VideoRange>{VideoRange::SDR});
	EXPECT_EQ(inf.GetAudio(), std::string_view{"aac"});
	EXPECT_EQ(inf.GetClosedCaptions(), std::string_view{"NONE"});
	EXPECT_FALSE(inf.GetScore());
	EXPECT_EQ(inf.ToString(), line);

	inf.SetBandwidth(1500000);
	inf.UnsetAudio();
	inf.SetResolution({1920, 1080});
	inf.SetClosedCaptions("cc");
	EXPECT_EQ(Render(std::move(inf)),
		  "#EXT-X-STREAM-INF:BANDWIDTH=1500000,AVERAGE-BANDWIDTH=1000000,CODECS=\"avc1.4d401f,mp4a.40.2\",RESOLUTION=1920x1080,FRAME-RATE=29.97,HDCP-LEVEL=TYPE-0,VIDEO-RANGE=SDR,CLOSED-CAPTIONS=\"cc\"");

	StreamInf typed{800000};
	EXPECT_EQ(typed.ToString(), "#EXT-X-STREAM-INF:BANDWIDTH=800000");
	typed.SetClosedCaptions("NONE");
	typed.SetScore(1.5);
	EXPECT_EQ(Render(std::move(typed)),
		  "#EXT-X-STREAM-INF:BANDWIDTH=800000,SCORE=1.5,CLOSED-CAPTIONS=NONE");
}

TEST(StreamInf, WrongShape)
{
	/* accessors never throw; a value of the wrong shape reads as
	   absent */
	StreamInf inf{MakeParsedTag("#EXT-X-STREAM-INF:BANDWIDTH=1,RESOLUTION=\"1920x1080\",FRAME-RATE=fast,AUDIO=aac")};
	EXPECT_FALSE(inf.GetResolution());
	EXPECT_FALSE(inf.GetFrameRate());
	EXPECT_FALSE(inf.GetAudio());

	ExpectValidationError<StreamInf>("#EXT-X-STREAM-INF:CODECS=\"x\"",
					 ValidationErrorCode::MISSING_REQUIRED_ATTRIBUTE,
					 "BANDWIDTH");
	ExpectValidationError<StreamInf>("#EXT-X-STREAM-INF:BANDWIDTH=1.5",
					 ValidationErrorCode::ERROR_EXTRACTING_ATTRIBUTE_LIST_VALUE,
					 "BANDWIDTH");
}

TEST(IFrameStreamInf, ParseMutate)
{
	IFrameStreamInf inf{MakeParsedTag("#EXT-X-I-FRAME-STREAM-INF:BANDWIDTH=86000,URI=\"low/iframe.m3u8\"")};
	EXPECT_EQ(inf.GetUri(), "low/iframe.m3u8");
	EXPECT_EQ(inf.GetBandwidth(), 86000u);

	inf.SetCodecs("avc1.4d001f");
	EXPECT_EQ(Render(std::move(inf)),
		  "#EXT-X-I-FRAME-STREAM-INF:URI=\"low/iframe.m3u8\",BANDWIDTH=86000,CODECS=\"avc1.4d001f\"");

	ExpectValidationError<IFrameStreamInf>("#EXT-X-I-FRAME-STREAM-INF:BANDWIDTH=86000",
					       ValidationErrorCode::MISSING_REQUIRED_ATTRIBUTE,
					       "URI");
}
