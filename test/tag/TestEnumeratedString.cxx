// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "tag/EnumeratedStringList.hxx"
#include "tag/hls/Enumerations.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace Hls;

TEST(EnumeratedString, Known)
{
	const EnumeratedString<KeyMethod> method{"SAMPLE-AES"};
	EXPECT_TRUE(method.IsKnown());
	EXPECT_EQ(method.GetKnown(), KeyMethod::SAMPLE_AES);
	EXPECT_EQ(method.AsString(), "SAMPLE-AES");
	EXPECT_EQ(method, KeyMethod::SAMPLE_AES);

	constexpr EnumeratedString<KeyMethod> none{KeyMethod::NONE};
	static_assert(none.AsString() == "NONE");
}

TEST(EnumeratedString, Unknown)
{
	static constexpr std::string_view text = "AES-512";
	const EnumeratedString<KeyMethod> method{text};
	EXPECT_FALSE(method.IsKnown());
	EXPECT_FALSE(method.GetKnown());
	EXPECT_EQ(method.AsString(), text);

	/* not copied */
	EXPECT_EQ(method.AsString().data(), text.data());

	EXPECT_EQ(method, EnumeratedString<KeyMethod>{"AES-512"});
	EXPECT_FALSE(method == KeyMethod::AES_128);

	/* case sensitive */
	EXPECT_FALSE(EnumeratedString<KeyMethod>{"none"}.IsKnown());
}

TEST(EnumeratedString, Cea708Service)
{
	EXPECT_EQ(GetCea708ServiceNumber(EnumeratedString<InstreamId>{"SERVICE1"}), 1u);
	EXPECT_EQ(GetCea708ServiceNumber(EnumeratedString<InstreamId>{"SERVICE63"}), 63u);
	EXPECT_FALSE(GetCea708ServiceNumber(EnumeratedString<InstreamId>{"SERVICE0"}));
	EXPECT_FALSE(GetCea708ServiceNumber(EnumeratedString<InstreamId>{"SERVICE64"}));
	EXPECT_FALSE(GetCea708ServiceNumber(EnumeratedString<InstreamId>{"SERVICE"}));
	EXPECT_FALSE(GetCea708ServiceNumber(InstreamId::CC2));
}

template<typename T>
static std::vector<std::string>
ToVector(const EnumeratedStringList<T> &list)
{
	std::vector<std::string> result;
	for (const auto i : list)
		result.emplace_back(i.AsString());
	return result;
}

TEST(EnumeratedStringList, Iterate)
{
	const EnumeratedStringList<Cue> list{"PRE,FOO,ONCE"};
	EXPECT_FALSE(list.empty());
	EXPECT_EQ(list.size(), 3u);
	EXPECT_EQ(ToVector(list),
		  (std::vector<std::string>{"PRE", "FOO", "ONCE"}));
	EXPECT_TRUE(list.Contains(Cue::ONCE));
	EXPECT_TRUE(list.Contains(EnumeratedString<Cue>{"FOO"}));
	EXPECT_FALSE(list.Contains(Cue::POST));

	const EnumeratedStringList<Cue> empty;
	EXPECT_TRUE(empty.empty());
	EXPECT_EQ(empty.size(), 0u);
	EXPECT_TRUE(empty.begin() == empty.end());
}

TEST(EnumeratedStringList, InsertRemove)
{
	EnumeratedStringList<Cue> list;
	EXPECT_TRUE(list.Insert(Cue::PRE));
	EXPECT_TRUE(list.Insert(Cue::ONCE));
	EXPECT_FALSE(list.Insert(Cue::PRE));
	EXPECT_EQ(list.AsString(), "PRE,ONCE");

	EXPECT_TRUE(list.Insert(Cue::POST));
	EXPECT_EQ(list.AsString(), "PRE,ONCE,POST");

	/* middle */
	EXPECT_TRUE(list.Remove(Cue::ONCE));
	EXPECT_EQ(list.AsString(), "PRE,POST");

	EXPECT_FALSE(list.Remove(Cue::ONCE));

	/* last */
	EXPECT_TRUE(list.Remove(Cue::POST));
	EXPECT_EQ(list.AsString(), "PRE");

	/* only */
	EXPECT_TRUE(list.Remove(Cue::PRE));
	EXPECT_TRUE(list.empty());
	EXPECT_EQ(list.AsString(), "");
}

TEST(EnumeratedStringList, RemoveFirst)
{
	/* a token which is a prefix of another one must not match */
	EnumeratedStringList<MediaCharacteristic> list{"public.easy-to-read-x,public.easy-to-read"};
	EXPECT_EQ(list.size(), 2u);
	EXPECT_TRUE(list.Contains(MediaCharacteristic::EASY_TO_READ));

	EXPECT_TRUE(list.Remove(EnumeratedString<MediaCharacteristic>{"public.easy-to-read-x"}));
	EXPECT_EQ(list.AsString(), "public.easy-to-read");

	EXPECT_EQ((EnumeratedStringList<Cue>{Cue::PRE, Cue::POST}).AsString(),
		  "PRE,POST");
}
