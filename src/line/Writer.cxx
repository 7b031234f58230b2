// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Writer.hxx"
#include "io/OutputStream.hxx"

#include <type_traits>

namespace Hls {

void
Writer::WriteRaw(std::string_view line)
{
	os.Write(line);
	os.Write(std::string_view{"\n"});
}

void
Writer::WriteLine(HlsLine &&line)
{
	std::visit([this](auto &&l){
		using T = std::decay_t<decltype(l)>;
		if constexpr (std::is_same_v<T, Tag>)
			WriteTag(std::move(l));
		else if constexpr (std::is_same_v<T, CustomTagAccess>)
			WriteRaw(std::move(l).IntoInner().Get());
		else if constexpr (std::is_same_v<T, UnknownTag>)
			WriteRaw(l.original_input);
		else if constexpr (std::is_same_v<T, CommentLine>)
			WriteComment(l.text);
		else if constexpr (std::is_same_v<T, UriLine>)
			WriteUri(l.uri);
		else
			WriteBlank();
	}, std::move(line));
}

void
Writer::WriteBlank()
{
	WriteRaw({});
}

void
Writer::WriteComment(std::string_view text)
{
	os.Write(std::string_view{"#"});
	WriteRaw(text);
}

void
Writer::WriteUri(std::string_view uri)
{
	WriteRaw(uri);
}

void
Writer::WriteTag(Tag &&tag)
{
	WriteRaw(std::move(tag).IntoInner().Get());
}

void
Writer::WriteCustomTag(const CustomTag &tag)
{
	WriteRaw(CalculateOutput(tag.ToWritableTag()));
}

} // namespace Hls
