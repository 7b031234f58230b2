// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "WritableTag.hxx"
#include "LineBuilder.hxx"

#include <type_traits>

namespace Hls {

WritableAttributeValue
ToWritableAttributeValue(const AttributeValue &value)
{
	return std::visit([](const auto &v) -> WritableAttributeValue {
		using T = std::decay_t<decltype(v)>;
		if constexpr (std::is_same_v<T, QuotedString>)
			return WritableQuotedString{std::string{v.value}};
		else if constexpr (std::is_same_v<T, UnquotedString>)
			return WritableUnquotedString{std::string{v.value}};
		else
			return v;
	}, value);
}

void
AppendAttribute(LineBuilder &b, std::string_view name,
		const WritableAttributeValue &value)
{
	std::visit([&b, name](const auto &v){
		using T = std::decay_t<decltype(v)>;
		if constexpr (std::is_same_v<T, uint64_t>)
			b.Integer(name, v);
		else if constexpr (std::is_same_v<T, double>)
			b.Float(name, v);
		else if constexpr (std::is_same_v<T, DecimalResolution>)
			b.Resolution(name, v);
		else if constexpr (std::is_same_v<T, WritableQuotedString>)
			b.Quoted(name, std::string_view{v.value});
		else
			b.Unquoted(name, std::string_view{v.value});
	}, value);
}

std::string
CalculateOutput(const WritableTag &tag)
{
	LineBuilder b{std::string_view{tag.name}};

	std::visit([&b](const auto &v){
		using T = std::decay_t<decltype(v)>;
		if constexpr (std::is_same_v<T, EmptyValue>) {
		} else if constexpr (std::is_same_v<T, uint64_t>)
			b.FormatValue("{}", v);
		else if constexpr (std::is_same_v<T, DecimalIntegerRange>)
			b.Value(FormatDecimalIntegerRange(v));
		else if constexpr (std::is_same_v<T, WritableFloatWithTitle>)
			b.FormatValue("{},{}", FormatDecimalFloat(v.number), v.title);
		else if constexpr (std::is_same_v<T, DateTime>)
			b.Value(FormatDateTime(v));
		else if constexpr (std::is_same_v<T, WritableAttributeList>) {
			for (const auto &[name, value] : v)
				AppendAttribute(b, name, value);
		} else
			b.Value(v.value);
	}, tag.value);

	return b.Finish();
}

} // namespace Hls
