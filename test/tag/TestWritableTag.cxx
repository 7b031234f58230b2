// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "tag/WritableTag.hxx"

#include <gtest/gtest.h>

using namespace Hls;

TEST(WritableTag, CalculateOutput)
{
	EXPECT_EQ(CalculateOutput({"-X-FOO", EmptyValue{}}), "#EXT-X-FOO");
	EXPECT_EQ(CalculateOutput({"-X-FOO", uint64_t{42}}), "#EXT-X-FOO:42");
	EXPECT_EQ(CalculateOutput({"-X-FOO", DecimalIntegerRange{10, 5}}),
		  "#EXT-X-FOO:10@5");
	EXPECT_EQ(CalculateOutput({"-X-FOO", WritableFloatWithTitle{2.5, "t"}}),
		  "#EXT-X-FOO:2.5,t");
	EXPECT_EQ(CalculateOutput({"-X-FOO", WritableRawValue{"anything, really"}}),
		  "#EXT-X-FOO:anything, really");

	DateTime dt;
	dt.timezone.hour = -3;
	EXPECT_EQ(CalculateOutput({"-X-FOO", dt}),
		  "#EXT-X-FOO:1970-01-01T00:00:00.000-03:00");

	const WritableAttributeList list{
		{"COUNT", uint64_t{3}},
		{"RATIO", 0.25},
		{"SIZE", DecimalResolution{640, 480}},
		{"LABEL", WritableQuotedString{"a,b"}},
		{"MODE", WritableUnquotedString{"FAST"}},
	};
	EXPECT_EQ(CalculateOutput({"-X-FOO", list}),
		  "#EXT-X-FOO:COUNT=3,RATIO=0.25,SIZE=640x480,LABEL=\"a,b\",MODE=FAST");
}

TEST(WritableTag, ToWritableAttributeValue)
{
	EXPECT_EQ(ToWritableAttributeValue(QuotedString{"x"}),
		  WritableAttributeValue{WritableQuotedString{"x"}});
	EXPECT_EQ(ToWritableAttributeValue(UnquotedString{"Y"}),
		  WritableAttributeValue{WritableUnquotedString{"Y"}});
	EXPECT_EQ(ToWritableAttributeValue(uint64_t{7}),
		  WritableAttributeValue{uint64_t{7}});
	EXPECT_EQ(ToWritableAttributeValue(-1.5),
		  WritableAttributeValue{-1.5});
}
