// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "StringSplit.hxx"

#include <cstddef>
#include <iterator>
#include <string_view>

/**
 * Split a string at a certain separator character into sub strings
 * and allow iterating over the segments.
 *
 * Two consecutive separator characters result in an empty string.
 *
 * An empty input string returns one empty string.
 */
class IterableSplitString {
	std::string_view s;
	char separator;

public:
	constexpr IterableSplitString(std::string_view _s,
				      char _separator) noexcept
		:s(_s), separator(_separator) {}

	class Iterator final {
		friend class IterableSplitString;

		std::string_view current, rest;

		char separator;

		constexpr Iterator(std::string_view _s,
				   char _separator) noexcept
			:rest(_s), separator(_separator)
		{
			Next();
		}

		constexpr Iterator(std::nullptr_t) noexcept
			:current(), rest(), separator() {}

		constexpr void Next() noexcept {
			if (rest.data() == nullptr)
				current = {};
			else {
				const auto [a, b] = Split(rest, separator);
				current = a;
				rest = b;
			}
		}

	public:
		using iterator_category = std::forward_iterator_tag;
		using value_type = std::string_view;
		using difference_type = std::ptrdiff_t;

		constexpr Iterator &operator++() noexcept {
			Next();
			return *this;
		}

		constexpr bool operator==(const Iterator &other) const noexcept {
			return current.data() == other.current.data();
		}

		constexpr std::string_view operator*() const noexcept {
			return current;
		}

		constexpr const std::string_view *operator->() const noexcept {
			return &current;
		}
	};

	using iterator = Iterator;
	using const_iterator = Iterator;

	constexpr const_iterator begin() const noexcept {
		return {s, separator};
	}

	constexpr const_iterator end() const noexcept {
		return nullptr;
	}
};
