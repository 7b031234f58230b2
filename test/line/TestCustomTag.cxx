// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "line/Line.hxx"
#include "line/Writer.hxx"
#include "config/ParsingOptions.hxx"
#include "tag/CustomTag.hxx"
#include "tag/Extract.hxx"
#include "tag/ParsedTag.hxx"
#include "ValidationError.hxx"
#include "io/StringOutputStream.hxx"

#include <gtest/gtest.h>

using namespace Hls;

namespace {

/**
 * "#EXT-X-EXAMPLE:COUNT=<n>,LABEL="<s>"", implemented by the
 * application.
 */
class ExampleTag final : public CustomTag {
public:
	uint64_t count;
	std::string label;

	ExampleTag(uint64_t _count, std::string_view _label) noexcept
		:count(_count), label(_label) {}

	WritableTag ToWritableTag() const override {
		return {
			"-X-EXAMPLE",
			WritableAttributeList{
				{"COUNT", count},
				{"LABEL", WritableQuotedString{label}},
			},
		};
	}
};

class ExampleProvider final : public CustomTagProvider {
	bool replace_version;

public:
	explicit ExampleProvider(bool _replace_version=false) noexcept
		:replace_version(_replace_version) {}

	bool IsKnownName(std::string_view name) const noexcept override {
		return name == "-X-EXAMPLE" ||
			(replace_version && name == "-X-VERSION");
	}

	std::unique_ptr<CustomTag> Parse(const ParsedTag &tag) const override {
		if (tag.name == "-X-VERSION")
			return std::make_unique<ExampleTag>(0, "version");

		const auto &list = GetAttributeList(tag);
		return std::make_unique<ExampleTag>(RequireDecimalInteger(list, "COUNT"),
						    RequireQuotedString(list, "LABEL"));
	}
};

/**
 * A provider which claims a name but does not implement Parse().
 */
class LazyProvider final : public CustomTagProvider {
public:
	bool IsKnownName(std::string_view name) const noexcept override {
		return name == "-X-LAZY";
	}
};

} // anonymous namespace

static constexpr std::string_view example_line =
	"#EXT-X-EXAMPLE:COUNT=3,LABEL=\"x\"";

TEST(CustomTag, Parse)
{
	const ExampleProvider provider;
	auto result = ParseLine(example_line, ParsingOptions::All(), &provider);
	EXPECT_FALSE(result.remaining);

	auto *access = std::get_if<CustomTagAccess>(&result.line);
	ASSERT_NE(access, nullptr);

	const auto *example = access->As<ExampleTag>();
	ASSERT_NE(example, nullptr);
	EXPECT_EQ(example->count, 3u);
	EXPECT_EQ(example->label, "x");
	EXPECT_FALSE(access->IsDirty());

	/* read access keeps the original line */
	EXPECT_EQ(&access->Get(), example);
	const auto inner = std::move(*access).IntoInner();
	EXPECT_FALSE(inner.IsOwned());
	EXPECT_EQ(inner.Get().data(), example_line.data());
}

TEST(CustomTag, Mutate)
{
	const ExampleProvider provider;
	auto result = ParseLine(example_line, ParsingOptions::All(), &provider);
	auto &access = std::get<CustomTagAccess>(result.line);

	auto *example = access.AsMutable<ExampleTag>();
	ASSERT_NE(example, nullptr);
	EXPECT_TRUE(access.IsDirty());
	example->count = 4;

	EXPECT_EQ(std::move(access).IntoInner().Get(),
		  "#EXT-X-EXAMPLE:COUNT=4,LABEL=\"x\"");
}

TEST(CustomTag, MutateThroughBase)
{
	CustomTagAccess access{std::make_unique<ExampleTag>(1, "a")};
	EXPECT_EQ(access.ToString(), "#EXT-X-EXAMPLE:COUNT=1,LABEL=\"a\"");

	static_cast<ExampleTag &>(access.GetMutable()).label = "b";
	EXPECT_EQ(access.ToString(), "#EXT-X-EXAMPLE:COUNT=1,LABEL=\"b\"");
}

TEST(CustomTag, WrongType)
{
	struct OtherTag final : CustomTag {
		WritableTag ToWritableTag() const override {
			return {"-X-OTHER", EmptyValue{}};
		}
	};

	CustomTagAccess access{std::make_unique<OtherTag>()};
	EXPECT_EQ(access.As<ExampleTag>(), nullptr);
	EXPECT_EQ(access.AsMutable<ExampleTag>(), nullptr);
	EXPECT_FALSE(access.IsDirty());
	EXPECT_EQ(access.ToString(), "#EXT-X-OTHER");
}

TEST(CustomTag, Invalid)
{
	const ExampleProvider provider;

	/* LABEL is missing */
	auto result = ParseLine("#EXT-X-EXAMPLE:COUNT=3",
				ParsingOptions::All(), &provider);
	const auto *unknown = std::get_if<UnknownTag>(&result.line);
	ASSERT_NE(unknown, nullptr);
	EXPECT_TRUE(unknown->IsInvalid());
	EXPECT_EQ(unknown->name, "-X-EXAMPLE");

	try {
		std::rethrow_exception(unknown->error);
	} catch (const ValidationError &e) {
		EXPECT_EQ(e.GetCode(),
			  ValidationErrorCode::MISSING_REQUIRED_ATTRIBUTE);
		EXPECT_EQ(e.GetAttributeName(), "LABEL");
	}
}

TEST(CustomTag, NotImplemented)
{
	const LazyProvider provider{};
	auto result = ParseLine("#EXT-X-LAZY:1", ParsingOptions::All(),
				&provider);
	const auto *unknown = std::get_if<UnknownTag>(&result.line);
	ASSERT_NE(unknown, nullptr);
	ASSERT_TRUE(unknown->IsInvalid());

	try {
		std::rethrow_exception(unknown->error);
	} catch (const ValidationError &e) {
		EXPECT_EQ(e.GetCode(), ValidationErrorCode::NOT_IMPLEMENTED);
	}

	/* names not claimed by the provider are unaffected */
	result = ParseLine("#EXT-X-VERSION:3", ParsingOptions::All(),
			   &provider);
	EXPECT_TRUE(std::holds_alternative<Tag>(result.line));
}

TEST(CustomTag, ReplacesBuiltIn)
{
	const ExampleProvider provider{true};

	/* the provider is consulted first, even if the built-in name
	   is disabled */
	for (const auto &options : {ParsingOptions::All(), ParsingOptions::None()}) {
		auto result = ParseLine("#EXT-X-VERSION:3", options, &provider);
		const auto *access = std::get_if<CustomTagAccess>(&result.line);
		ASSERT_NE(access, nullptr);
		ASSERT_NE(access->As<ExampleTag>(), nullptr);
		EXPECT_EQ(access->As<ExampleTag>()->label, "version");
	}

	/* without the provider, the built-in record is used */
	auto result = ParseLine("#EXT-X-VERSION:3", ParsingOptions::All());
	const auto *tag = std::get_if<Tag>(&result.line);
	ASSERT_NE(tag, nullptr);
	EXPECT_EQ(tag->GetName(), TagName::VERSION);
}

TEST(CustomTag, Write)
{
	StringOutputStream sos;
	Writer writer{sos};

	writer.WriteCustomTag(ExampleTag{7, "seven"});

	const ExampleProvider provider;
	auto result = ParseLine(example_line, ParsingOptions::All(), &provider);
	writer.WriteLine(std::move(result.line));

	EXPECT_EQ(sos.GetValue(),
		  "#EXT-X-EXAMPLE:COUNT=7,LABEL=\"seven\"\n"
		  "#EXT-X-EXAMPLE:COUNT=3,LABEL=\"x\"\n");
}
