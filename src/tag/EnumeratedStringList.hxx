// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_ENUMERATED_STRING_LIST_HXX
#define HLS_ENUMERATED_STRING_LIST_HXX

#include "EnumeratedString.hxx"
#include "MaybeOwnedString.hxx"
#include "util/IterableSplitString.hxx"

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <string>
#include <string_view>

namespace Hls {

/**
 * A comma separated list of #EnumeratedString tokens, e.g. the
 * CHARACTERISTICS of EXT-X-MEDIA.  The list is stored as its
 * comma-joined text at all times; Insert() and Remove() splice that
 * text, so an untouched list never needs to be rebuilt.
 */
template<typename T>
class EnumeratedStringList {
	MaybeOwnedString text;

public:
	EnumeratedStringList() noexcept = default;

	/**
	 * Refer to the given comma-joined text without copying it.
	 */
	explicit EnumeratedStringList(std::string_view _text) noexcept
		:text(_text) {}

	EnumeratedStringList(std::initializer_list<EnumeratedString<T>> items) {
		for (const auto &i : items)
			Insert(i);
	}

	class const_iterator {
		IterableSplitString::Iterator i;

	public:
		using iterator_category = std::forward_iterator_tag;
		using value_type = EnumeratedString<T>;
		using difference_type = std::ptrdiff_t;

		constexpr explicit const_iterator(IterableSplitString::Iterator _i) noexcept
			:i(_i) {}

		const_iterator &operator++() noexcept {
			++i;
			return *this;
		}

		bool operator==(const const_iterator &other) const noexcept {
			return i == other.i;
		}

		EnumeratedString<T> operator*() const noexcept {
			return EnumeratedString<T>{*i};
		}
	};

	const_iterator begin() const noexcept {
		if (empty())
			return end();

		return const_iterator{IterableSplitString{text.Get(), ','}.begin()};
	}

	const_iterator end() const noexcept {
		return const_iterator{IterableSplitString{{}, ','}.end()};
	}

	bool empty() const noexcept {
		return text.Get().empty();
	}

	std::size_t size() const noexcept {
		std::size_t n = 0;
		for (auto i = begin(); i != end(); ++i)
			++n;
		return n;
	}

	/**
	 * @return the comma-joined text
	 */
	std::string_view AsString() const noexcept {
		return text.Get();
	}

	[[gnu::pure]]
	bool Contains(const EnumeratedString<T> &item) const noexcept {
		return Find(item.AsString()) != std::string_view::npos;
	}

	/**
	 * Append the item unless it is already present.
	 *
	 * @return true if the list was modified
	 */
	bool Insert(const EnumeratedString<T> &item) {
		if (Contains(item))
			return false;

		std::string s = std::move(text).ToString();
		if (!s.empty())
			s.push_back(',');
		s.append(item.AsString());
		text = MaybeOwnedString{std::move(s)};
		return true;
	}

	/**
	 * @return true if the item was found (and removed)
	 */
	bool Remove(const EnumeratedString<T> &item) {
		const auto token = item.AsString();
		const auto position = Find(token);
		if (position == std::string_view::npos)
			return false;

		std::string s = std::move(text).ToString();
		if (position + token.size() < s.size())
			/* remove the token and the comma after it */
			s.erase(position, token.size() + 1);
		else if (position > 0)
			/* the last one: remove the comma before it */
			s.erase(position - 1, token.size() + 1);
		else
			s.clear();

		text = MaybeOwnedString{std::move(s)};
		return true;
	}

	bool operator==(const EnumeratedStringList &other) const noexcept {
		return AsString() == other.AsString();
	}

private:
	/**
	 * @return the position of the token within the text or npos
	 */
	[[gnu::pure]]
	std::size_t Find(std::string_view token) const noexcept {
		if (empty())
			return std::string_view::npos;

		const auto s = text.Get();
		for (const std::string_view i : IterableSplitString{s, ','})
			if (i == token)
				return i.data() - s.data();

		return std::string_view::npos;
	}
};

} // namespace Hls

#endif
