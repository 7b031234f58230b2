// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Daterange.hxx"
#include "tag/Extract.hxx"
#include "tag/LineBuilder.hxx"
#include "tag/ParsedTag.hxx"
#include "tag/Reinterpret.hxx"

#include <algorithm>

namespace Hls {

static constexpr std::string_view CLIENT_ATTRIBUTE_PREFIX = "X-";

Daterange::Daterange(const ParsedTag &tag)
	:DirtyLineTag(tag.original_input)
{
	CheckTagName(tag, NAME);

	const auto &list = GetAttributeList(tag);
	id = MaybeOwnedString{RequireQuotedString(list, "ID")};

	const auto start = RequireQuotedString(list, "START-DATE");
	try {
		start_date = ParseDateTime(start);
	} catch (...) {
		std::throw_with_nested(ValidationError::ErrorExtractingAttributeListValue("START-DATE"));
	}

	class_.Found(list.Find("CLASS"));
	cue.Found(list.Find("CUE"));
	end_date.Found(list.Find("END-DATE"));
	duration.Found(list.Find("DURATION"));
	planned_duration.Found(list.Find("PLANNED-DURATION"));
	scte35_cmd.Found(list.Find("SCTE35-CMD"));
	scte35_out.Found(list.Find("SCTE35-OUT"));
	scte35_in.Found(list.Find("SCTE35-IN"));
	end_on_next.Found(list.Find("END-ON-NEXT"));

	for (const auto &[name, value] : list)
		if (name.starts_with(CLIENT_ATTRIBUTE_PREFIX) &&
		    GetClientAttribute(name) == nullptr)
			client_attributes.emplace_back(std::string{name},
						       ToWritableAttributeValue(value));
}

Daterange::Daterange(std::string _id, const DateTime &_start_date)
	:id(std::move(_id)), start_date(_start_date)
{
	InitOutputLine();
}

std::optional<EnumeratedStringList<Cue>>
Daterange::GetCue() const noexcept
{
	return cue.Get<EnumeratedStringList<Cue>>(GetQuotedEnumeratedList<Cue>);
}

std::optional<DateTime>
Daterange::GetEndDate() const noexcept
{
	return end_date.Get(GetQuotedDateTime);
}

const WritableAttributeValue *
Daterange::GetClientAttribute(std::string_view name) const noexcept
{
	for (const auto &[n, v] : client_attributes)
		if (n == name)
			return &v;
	return nullptr;
}

void
Daterange::SetClientAttribute(std::string_view name,
			      WritableAttributeValue value)
{
	auto i = std::find_if(client_attributes.begin(), client_attributes.end(),
			      [name](const auto &a){ return a.first == name; });
	if (i != client_attributes.end())
		i->second = std::move(value);
	else
		client_attributes.emplace_back(std::string{name},
					       std::move(value));

	MarkDirty();
}

void
Daterange::UnsetClientAttribute(std::string_view name) noexcept
{
	std::erase_if(client_attributes,
		      [name](const auto &a){ return a.first == name; });
	MarkDirty();
}

std::string
Daterange::CalculateLine() const
{
	LineBuilder b{NAME};
	b.Quoted("ID", id.Get())
		.QuotedDateTime("START-DATE", start_date)
		.Quoted("CLASS", GetClass());

	if (const auto c = GetCue())
		b.Quoted("CUE", c->AsString());

	if (const auto end = GetEndDate())
		b.QuotedDateTime("END-DATE", *end);

	b.Float("DURATION", GetDuration())
		.Float("PLANNED-DURATION", GetPlannedDuration());

	for (const auto &[name, value] : client_attributes)
		AppendAttribute(b, name, value);

	return b.Unquoted("SCTE35-CMD", GetScte35Cmd())
		.Unquoted("SCTE35-OUT", GetScte35Out())
		.Unquoted("SCTE35-IN", GetScte35In())
		.YesFlag("END-ON-NEXT", IsEndOnNext())
		.Finish();
}

} // namespace Hls
