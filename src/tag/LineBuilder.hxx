// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_LINE_BUILDER_HXX
#define HLS_LINE_BUILDER_HXX

#include "TagName.hxx"

#include <fmt/format.h>

#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Hls {

struct DateTime;
struct DecimalResolution;

/**
 * Renders a tag line in canonical form: "#EXT<name>", then either a
 * plain value or an attribute list.
 */
class LineBuilder {
	std::string line;

	bool has_value = false;

public:
	explicit LineBuilder(std::string_view name);

	explicit LineBuilder(TagName name)
		:LineBuilder(GetTagNameString(name)) {}

	/**
	 * Append a plain value (after the colon).
	 */
	LineBuilder &Value(std::string_view value) {
		BeginValue();
		line.append(value);
		return *this;
	}

	template<typename... Args>
	LineBuilder &FormatValue(fmt::format_string<Args...> format_str,
				 Args&&... args) {
		BeginValue();
		fmt::format_to(std::back_inserter(line), format_str,
			       std::forward<Args>(args)...);
		return *this;
	}

	LineBuilder &Quoted(std::string_view name, std::string_view value);

	LineBuilder &Unquoted(std::string_view name, std::string_view value);

	LineBuilder &Integer(std::string_view name, uint64_t value);

	LineBuilder &Float(std::string_view name, double value);

	LineBuilder &Resolution(std::string_view name, DecimalResolution value);

	LineBuilder &QuotedDateTime(std::string_view name, const DateTime &value);

	/**
	 * Append "NAME=YES" if the flag is set, nothing otherwise.
	 */
	LineBuilder &YesFlag(std::string_view name, bool value) {
		if (value)
			Unquoted(name, std::string_view{"YES"});
		return *this;
	}

	/* overloads which do nothing if the value is absent */

	LineBuilder &Quoted(std::string_view name,
			    std::optional<std::string_view> value) {
		if (value)
			Quoted(name, *value);
		return *this;
	}

	LineBuilder &Unquoted(std::string_view name,
			      std::optional<std::string_view> value) {
		if (value)
			Unquoted(name, *value);
		return *this;
	}

	LineBuilder &Integer(std::string_view name,
			     std::optional<uint64_t> value) {
		if (value)
			Integer(name, *value);
		return *this;
	}

	LineBuilder &Float(std::string_view name,
			   std::optional<double> value) {
		if (value)
			Float(name, *value);
		return *this;
	}

	std::string Finish() noexcept {
		return std::move(line);
	}

private:
	void BeginValue() {
		line.push_back(has_value ? ',' : ':');
		has_value = true;
	}

	void BeginAttribute(std::string_view name) {
		BeginValue();
		line.append(name);
		line.push_back('=');
	}
};

} // namespace Hls

#endif
