// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "value/TagValue.hxx"
#include "value/DecimalResolution.hxx"
#include "SyntaxError.hxx"

#include <gtest/gtest.h>

using namespace Hls;

TEST(Classify, Empty)
{
	const auto result = ClassifyTagValue("");
	EXPECT_TRUE(std::holds_alternative<EmptyValue>(result.value));
	EXPECT_FALSE(result.remaining);
}

TEST(Classify, Unparsed)
{
	const auto result = ClassifyTagValue("3\r\n#EXTINF:5,\n");
	ASSERT_TRUE(std::holds_alternative<UnparsedValue>(result.value));
	EXPECT_EQ(std::get<UnparsedValue>(result.value).value, "3");
	ASSERT_TRUE(result.remaining);
	EXPECT_EQ(*result.remaining, "#EXTINF:5,\n");
}

TEST(Classify, FloatWithTitle)
{
	auto result = ClassifyTagValue("10.5,Some title, with comma\nnext");
	ASSERT_TRUE(std::holds_alternative<FloatWithTitle>(result.value));
	EXPECT_EQ(std::get<FloatWithTitle>(result.value).number, 10.5);
	EXPECT_EQ(std::get<FloatWithTitle>(result.value).title,
		  "Some title, with comma");
	EXPECT_EQ(result.remaining, std::string_view{"next"});

	result = ClassifyTagValue("4,");
	ASSERT_TRUE(std::holds_alternative<FloatWithTitle>(result.value));
	EXPECT_EQ(std::get<FloatWithTitle>(result.value).number, 4);
	EXPECT_TRUE(std::get<FloatWithTitle>(result.value).title.empty());

	try {
		ClassifyTagValue("abc,def");
		FAIL();
	} catch (const SyntaxError &e) {
		EXPECT_EQ(e.GetCode(),
			  SyntaxErrorCode::INVALID_FLOAT_FOR_DECIMAL_FLOATING_POINT);
	}
}

TEST(Classify, AttributeList)
{
	const auto result = ClassifyTagValue("BANDWIDTH=1280000,CODECS=\"avc1.4d401f,mp4a.40.2\",RESOLUTION=1280x720,FRAME-RATE=29.97\n");
	ASSERT_TRUE(std::holds_alternative<AttributeList>(result.value));

	const auto &list = std::get<AttributeList>(result.value);
	EXPECT_EQ(list.size(), 4u);

	ASSERT_NE(list.Find("BANDWIDTH"), nullptr);
	EXPECT_EQ(GetDecimalInteger(*list.Find("BANDWIDTH")), 1280000u);

	/* the comma inside the quotes does not split the list */
	ASSERT_NE(list.Find("CODECS"), nullptr);
	EXPECT_EQ(GetQuotedString(*list.Find("CODECS")),
		  std::string_view{"avc1.4d401f,mp4a.40.2"});

	ASSERT_NE(list.Find("RESOLUTION"), nullptr);
	EXPECT_EQ(GetDecimalResolution(*list.Find("RESOLUTION")),
		  (DecimalResolution{1280, 720}));

	ASSERT_NE(list.Find("FRAME-RATE"), nullptr);
	EXPECT_EQ(GetDecimalFloat(*list.Find("FRAME-RATE")), 29.97);

	EXPECT_EQ(list.Find("AUDIO"), nullptr);

	ASSERT_TRUE(result.remaining);
	EXPECT_TRUE(result.remaining->empty());
}

TEST(Classify, AttributeListFirstWins)
{
	const auto result = ClassifyTagValue("A=1,A=2");
	const auto &list = std::get<AttributeList>(result.value);
	EXPECT_EQ(list.size(), 2u);
	EXPECT_EQ(GetDecimalInteger(*list.Find("A")), 1u);
}

static constexpr struct {
	const char *input;
	SyntaxErrorCode code;
} attribute_list_errors[] = {
	{ "A=1,", SyntaxErrorCode::UNEXPECTED_END_OF_LINE_WHILE_READING_ATTRIBUTE_NAME },
	{ "A=1,B\n", SyntaxErrorCode::UNEXPECTED_END_OF_LINE_WHILE_READING_ATTRIBUTE_NAME },
	{ "A=1,B,C=2", SyntaxErrorCode::UNEXPECTED_CHARACTER_IN_ATTRIBUTE_NAME },
	{ "A=1,B\"=2", SyntaxErrorCode::UNEXPECTED_CHARACTER_IN_ATTRIBUTE_NAME },
	{ "A\"=1", SyntaxErrorCode::UNEXPECTED_CHARACTER_IN_ATTRIBUTE_NAME },
	{ "=1", SyntaxErrorCode::EMPTY_ATTRIBUTE_NAME },
	{ "A=1,=2", SyntaxErrorCode::EMPTY_ATTRIBUTE_NAME },
	{ "A=", SyntaxErrorCode::UNEXPECTED_EMPTY_ATTRIBUTE_VALUE },
	{ "A=,B=1", SyntaxErrorCode::UNEXPECTED_EMPTY_ATTRIBUTE_VALUE },
	{ "A=\"foo", SyntaxErrorCode::UNEXPECTED_END_OF_LINE_WITHIN_QUOTED_STRING },
	{ "A=\"foo\nB=\"bar\"", SyntaxErrorCode::UNEXPECTED_END_OF_LINE_WITHIN_QUOTED_STRING },
	{ "A=\"foo\"x", SyntaxErrorCode::UNEXPECTED_CHARACTER_AFTER_QUOTED_STRING },
	{ "A=1.2.3", SyntaxErrorCode::INVALID_FLOAT_IN_ATTRIBUTE_VALUE },
};

TEST(Classify, AttributeListErrors)
{
	for (const auto &i : attribute_list_errors) {
		try {
			ClassifyTagValue(i.input);
			ADD_FAILURE() << i.input;
		} catch (const SyntaxError &e) {
			EXPECT_EQ(e.GetCode(), i.code) << i.input;
		}
	}
}

TEST(Classify, UnexpectedCharacter)
{
	try {
		ParseOneAttributeValue("\"foo\"x");
		FAIL();
	} catch (const SyntaxError &e) {
		EXPECT_EQ(e.GetCharacter(), 'x');
		EXPECT_EQ(e.GetCategory(), SyntaxErrorCategory::TAG_VALUE);
	}
}

TEST(Classify, Numbers)
{
	/* an integer */
	auto result = ParseOneAttributeValue("42");
	EXPECT_EQ(GetDecimalInteger(result.value), 42u);
	EXPECT_EQ(GetDecimalFloat(result.value), 42.0);
	EXPECT_FALSE(result.more);
	EXPECT_FALSE(result.remaining);

	/* a dot makes it a float */
	result = ParseOneAttributeValue("42.0,X=1");
	EXPECT_TRUE(std::holds_alternative<double>(result.value));
	EXPECT_FALSE(GetDecimalInteger(result.value));
	EXPECT_EQ(GetDecimalFloat(result.value), 42.0);
	EXPECT_TRUE(result.more);
	EXPECT_EQ(result.remaining, std::string_view{"X=1"});

	/* negative numbers are floats */
	result = ParseOneAttributeValue("-42");
	EXPECT_TRUE(std::holds_alternative<double>(result.value));
	EXPECT_EQ(GetDecimalFloat(result.value), -42.0);

	/* a float without fractional part is an integer */
	result = ParseOneAttributeValue("1e3");
	EXPECT_EQ(GetDecimalInteger(result.value), 1000u);

	/* hexadecimal-sequence */
	result = ParseOneAttributeValue("0x1234abcd\r\n");
	EXPECT_EQ(GetUnquotedString(result.value),
		  std::string_view{"0x1234abcd"});
	EXPECT_FALSE(result.more);
	EXPECT_EQ(result.remaining, std::string_view{""});
}

TEST(Classify, EnumeratedAndYesNo)
{
	EXPECT_EQ(GetYesNo(ParseOneAttributeValue("YES").value), true);
	EXPECT_EQ(GetYesNo(ParseOneAttributeValue("NO").value), false);
	EXPECT_FALSE(GetYesNo(ParseOneAttributeValue("MAYBE").value));
	EXPECT_FALSE(GetYesNo(ParseOneAttributeValue("\"YES\"").value));
}

TEST(DecimalResolution, Parse)
{
	EXPECT_EQ(ParseDecimalResolution("1920x1080"),
		  (DecimalResolution{1920, 1080}));
	EXPECT_FALSE(ParseDecimalResolution("1920"));
	EXPECT_FALSE(ParseDecimalResolution("1920x"));
	EXPECT_FALSE(ParseDecimalResolution("x1080"));
	EXPECT_FALSE(ParseDecimalResolution("1920X1080"));
	EXPECT_EQ(FormatDecimalResolution({640, 360}), "640x360");
}

TEST(UnparsedValue, DecimalIntegerRange)
{
	EXPECT_EQ(UnparsedValue{"1024@512"}.AsDecimalIntegerRange(),
		  (DecimalIntegerRange{1024, 512}));
	EXPECT_EQ(UnparsedValue{"1024"}.AsDecimalIntegerRange(),
		  (DecimalIntegerRange{1024, std::nullopt}));
	EXPECT_THROW(UnparsedValue{"1024@"}.AsDecimalIntegerRange(),
		     std::invalid_argument);
	EXPECT_THROW(UnparsedValue{"-1"}.AsDecimalInteger(),
		     std::invalid_argument);

	EXPECT_EQ(FormatDecimalIntegerRange({1024, 512}), "1024@512");
	EXPECT_EQ(FormatDecimalIntegerRange({1024, std::nullopt}), "1024");
}

TEST(UnparsedValue, PlaylistType)
{
	EXPECT_EQ(UnparsedValue{"VOD"}.AsPlaylistType(), PlaylistTypeValue::VOD);
	EXPECT_EQ(UnparsedValue{"EVENT"}.AsPlaylistType(), PlaylistTypeValue::EVENT);
	EXPECT_THROW(UnparsedValue{"LIVE"}.AsPlaylistType(),
		     std::invalid_argument);
}

static constexpr struct {
	double value;
	std::string_view expected;
} decimal_floats[] = {
	{ 0, "0" },
	{ 10.0, "10" },
	{ 36.0, "36" },
	{ 2.5, "2.5" },
	{ -12.5, "-12.5" },
	{ 29.97, "29.97" },
	{ 0.1, "0.1" },
	{ 0.00001, "0.00001" },
	{ 1e-7, "0.0000001" },
	{ 1e16, "10000000000000000" },
	{ 1.5e20, "150000000000000000000" },
};

TEST(DecimalFloat, Format)
{
	for (const auto &i : decimal_floats)
		EXPECT_EQ(FormatDecimalFloat(i.value), i.expected);
}
