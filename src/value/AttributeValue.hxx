// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_ATTRIBUTE_VALUE_HXX
#define HLS_ATTRIBUTE_VALUE_HXX

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Hls {

/**
 * The contents of a quoted attribute value, without the quotes.
 */
struct QuotedString {
	std::string_view value;

	bool operator==(const QuotedString &) const noexcept = default;
};

/**
 * A bare attribute value token which is not a number, e.g. an
 * enumerated string ("AUDIO") or a resolution ("1920x1080").
 */
struct UnquotedString {
	std::string_view value;

	bool operator==(const UnquotedString &) const noexcept = default;
};

/**
 * One value of an attribute list.  All strings point into the
 * original input.
 *
 * Numbers are classified by their spelling: a token which is a
 * non-negative integer (or a float exactly representing one, e.g.
 * "1e3") is a decimal integer; "42.0" and "-42" are floats.
 */
using AttributeValue = std::variant<uint64_t, double,
				    QuotedString, UnquotedString>;

/**
 * The attributes of a tag in input order.  Lookups are linear, which
 * is faster than hashing for the handful of attributes a tag has.
 */
class AttributeList {
	std::vector<std::pair<std::string_view, AttributeValue>> items;

public:
	using const_iterator = decltype(items)::const_iterator;

	void Add(std::string_view name, const AttributeValue &value) {
		items.emplace_back(name, value);
	}

	/**
	 * Find the first attribute with the given name.
	 *
	 * @return nullptr if there is no such attribute
	 */
	[[gnu::pure]]
	const AttributeValue *Find(std::string_view name) const noexcept {
		for (const auto &[n, v] : items)
			if (n == name)
				return &v;
		return nullptr;
	}

	bool empty() const noexcept {
		return items.empty();
	}

	std::size_t size() const noexcept {
		return items.size();
	}

	const_iterator begin() const noexcept {
		return items.begin();
	}

	const_iterator end() const noexcept {
		return items.end();
	}

	bool operator==(const AttributeList &) const noexcept = default;
};

/* reinterpretation of a classified value as the type a specific
   attribute expects; std::nullopt means "wrong shape" */

[[gnu::pure]]
inline std::optional<std::string_view>
GetQuotedString(const AttributeValue &value) noexcept
{
	if (const auto *q = std::get_if<QuotedString>(&value))
		return q->value;
	return std::nullopt;
}

[[gnu::pure]]
inline std::optional<std::string_view>
GetUnquotedString(const AttributeValue &value) noexcept
{
	if (const auto *u = std::get_if<UnquotedString>(&value))
		return u->value;
	return std::nullopt;
}

[[gnu::pure]]
inline std::optional<uint64_t>
GetDecimalInteger(const AttributeValue &value) noexcept
{
	if (const auto *i = std::get_if<uint64_t>(&value))
		return *i;
	return std::nullopt;
}

/**
 * Read a number as double; a decimal integer is converted.
 */
[[gnu::pure]]
inline std::optional<double>
GetDecimalFloat(const AttributeValue &value) noexcept
{
	if (const auto *d = std::get_if<double>(&value))
		return *d;
	if (const auto *i = std::get_if<uint64_t>(&value))
		return static_cast<double>(*i);
	return std::nullopt;
}

/**
 * Interpret an unquoted "YES" or "NO".
 */
[[gnu::pure]]
inline std::optional<bool>
GetYesNo(const AttributeValue &value) noexcept
{
	const auto s = GetUnquotedString(value);
	if (!s)
		return std::nullopt;

	if (*s == "YES")
		return true;
	if (*s == "NO")
		return false;
	return std::nullopt;
}

} // namespace Hls

#endif
