// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LineBuilder.hxx"
#include "time/DateTime.hxx"
#include "value/DecimalResolution.hxx"
#include "value/TagValue.hxx"

namespace Hls {

LineBuilder::LineBuilder(std::string_view name)
{
	line.reserve(64);
	line.append(TAG_MARKER);
	line.append(name);
}

LineBuilder &
LineBuilder::Quoted(std::string_view name, std::string_view value)
{
	BeginAttribute(name);
	line.push_back('"');
	line.append(value);
	line.push_back('"');
	return *this;
}

LineBuilder &
LineBuilder::Unquoted(std::string_view name, std::string_view value)
{
	BeginAttribute(name);
	line.append(value);
	return *this;
}

LineBuilder &
LineBuilder::Integer(std::string_view name, uint64_t value)
{
	BeginAttribute(name);
	fmt::format_to(std::back_inserter(line), "{}", value);
	return *this;
}

LineBuilder &
LineBuilder::Float(std::string_view name, double value)
{
	BeginAttribute(name);
	line.append(FormatDecimalFloat(value));
	return *this;
}

LineBuilder &
LineBuilder::Resolution(std::string_view name, DecimalResolution value)
{
	BeginAttribute(name);
	fmt::format_to(std::back_inserter(line), "{}x{}",
		       value.width, value.height);
	return *this;
}

LineBuilder &
LineBuilder::QuotedDateTime(std::string_view name, const DateTime &value)
{
	return Quoted(name, std::string_view{FormatDateTime(value)});
}

} // namespace Hls
