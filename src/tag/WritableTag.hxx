// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_WRITABLE_TAG_HXX
#define HLS_WRITABLE_TAG_HXX

#include "time/DateTime.hxx"
#include "value/AttributeValue.hxx"
#include "value/DecimalResolution.hxx"
#include "value/TagValue.hxx"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Hls {

class LineBuilder;

struct WritableQuotedString {
	std::string value;

	bool operator==(const WritableQuotedString &) const noexcept = default;
};

struct WritableUnquotedString {
	std::string value;

	bool operator==(const WritableUnquotedString &) const noexcept = default;
};

/**
 * An owned attribute value which can be rendered into a tag line.
 */
using WritableAttributeValue = std::variant<uint64_t, double,
					    DecimalResolution,
					    WritableQuotedString,
					    WritableUnquotedString>;

/**
 * Attributes in output order.
 */
using WritableAttributeList =
	std::vector<std::pair<std::string, WritableAttributeValue>>;

struct WritableFloatWithTitle {
	double number;
	std::string title;

	bool operator==(const WritableFloatWithTitle &) const noexcept = default;
};

/**
 * Raw value text, written verbatim after the colon.
 */
struct WritableRawValue {
	std::string value;

	bool operator==(const WritableRawValue &) const noexcept = default;
};

using WritableTagValue = std::variant<EmptyValue, uint64_t,
				      DecimalIntegerRange,
				      WritableFloatWithTitle,
				      DateTime,
				      WritableAttributeList,
				      WritableRawValue>;

/**
 * A description of a tag line from which the line can be rendered.
 * This is how custom tags are serialized.
 */
struct WritableTag {
	/**
	 * The name after "#EXT", e.g. "-X-EXAMPLE".
	 */
	std::string name;

	WritableTagValue value;
};

/**
 * Convert a classified attribute value to an owned one.
 */
WritableAttributeValue
ToWritableAttributeValue(const AttributeValue &value);

/**
 * Append "NAME=VALUE" to the builder.
 */
void
AppendAttribute(LineBuilder &b, std::string_view name,
		const WritableAttributeValue &value);

/**
 * Render the complete tag line (without line terminator).
 */
std::string
CalculateOutput(const WritableTag &tag);

} // namespace Hls

#endif
