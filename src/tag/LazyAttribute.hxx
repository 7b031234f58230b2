// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef HLS_LAZY_ATTRIBUTE_HXX
#define HLS_LAZY_ATTRIBUTE_HXX

#include "value/AttributeValue.hxx"

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace Hls {

/**
 * An optional attribute of a tag record.  It is either absent, or it
 * still refers to the classified value from the input (which is
 * reinterpreted on each read), or it holds a value set by the
 * caller.
 *
 * @param T the type stored after Set()
 */
template<typename T>
class LazyAttribute {
	std::variant<std::monostate, AttributeValue, T> state;

public:
	bool IsAbsent() const noexcept {
		return std::holds_alternative<std::monostate>(state);
	}

	bool IsUnparsed() const noexcept {
		return std::holds_alternative<AttributeValue>(state);
	}

	bool IsUserDefined() const noexcept {
		return std::holds_alternative<T>(state);
	}

	/**
	 * Remember the classified value found in the input.  Only
	 * effective in the absent state, i.e. the first occurrence of
	 * an attribute wins.
	 */
	void Found(const AttributeValue &value) noexcept {
		if (IsAbsent())
			state.template emplace<AttributeValue>(value);
	}

	/**
	 * Like Found(), but accepts the result of
	 * AttributeList::Find().
	 */
	void Found(const AttributeValue *value) noexcept {
		if (value != nullptr)
			Found(*value);
	}

	void Set(T value) noexcept(std::is_nothrow_move_constructible_v<T>) {
		state.template emplace<T>(std::move(value));
	}

	void Unset() noexcept {
		state.template emplace<std::monostate>();
	}

	/**
	 * Resolve the value: a user-defined value is converted to #R,
	 * an unparsed value is passed to #reinterpret (which returns
	 * std::optional<R>, std::nullopt if the input value has the
	 * wrong shape).
	 */
	template<typename R=T, typename F>
	std::optional<R> Get(F &&reinterpret) const {
		if (const auto *v = std::get_if<T>(&state))
			return R(*v);

		if (const auto *v = std::get_if<AttributeValue>(&state))
			return std::forward<F>(reinterpret)(*v);

		return std::nullopt;
	}
};

} // namespace Hls

#endif
