// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "MakeTag.hxx"
#include "SyntaxError.hxx"
#include "ValidationError.hxx"
#include "line/Reader.hxx"
#include "tag/hls/Integer.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

using namespace Hls;

TEST(Error, SyntaxErrorCategory)
{
	EXPECT_EQ(GetSyntaxErrorCategory(SyntaxErrorCode::INVALID_UTF8),
		  SyntaxErrorCategory::GENERIC);
	EXPECT_EQ(GetSyntaxErrorCategory(SyntaxErrorCode::NO_TAG_NAME),
		  SyntaxErrorCategory::UNKNOWN_TAG);
	EXPECT_EQ(GetSyntaxErrorCategory(SyntaxErrorCode::INVALID_TIMEZONE_MINUTE),
		  SyntaxErrorCategory::DATE_TIME);
	EXPECT_EQ(GetSyntaxErrorCategory(SyntaxErrorCode::UNEXPECTED_EMPTY_ATTRIBUTE_VALUE),
		  SyntaxErrorCategory::TAG_VALUE);

	const auto e = SyntaxError::UnexpectedCharacterAfterQuotedString('x');
	EXPECT_EQ(e.GetCategory(), SyntaxErrorCategory::TAG_VALUE);
	EXPECT_EQ(e.GetCharacter(), 'x');
	EXPECT_STREQ(e.what(), "Unexpected character after quoted string: 'x'");
}

TEST(Error, NestedValidationError)
{
	try {
		Version{MakeParsedTag("#EXT-X-VERSION:abc")};
		FAIL();
	} catch (const ValidationError &e) {
		EXPECT_EQ(e.GetCode(), ValidationErrorCode::ERROR_EXTRACTING_TAG_VALUE);
		EXPECT_TRUE(e.GetAttributeName().empty());
		EXPECT_EQ(GetFullMessage(e),
			  "Failed to extract tag value; Invalid decimal integer: 'abc'");
		EXPECT_NE(FindNested<std::invalid_argument>(std::current_exception()),
			  nullptr);
	}
}

TEST(Error, ReaderError)
{
	Reader reader{"#EXT:1\n"};

	try {
		reader.ReadLine();
		FAIL();
	} catch (const ReaderError &e) {
		EXPECT_EQ(GetFullMessage(e),
			  "Malformed line \"#EXT:1\"; Tag marker without a name");
		EXPECT_EQ(FindNested<ValidationError>(std::current_exception()),
			  nullptr);
	}
}
