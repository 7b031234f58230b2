// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef DOMAIN_HXX
#define DOMAIN_HXX

#include <string_view>

/**
 * A named source of log messages.  Instances are compared by
 * identity, not by name.
 */
class Domain {
	const std::string_view name;

public:
	constexpr explicit Domain(std::string_view _name) noexcept
		:name(_name) {}

	Domain(const Domain &) = delete;
	Domain &operator=(const Domain &) = delete;

	constexpr std::string_view GetName() const noexcept {
		return name;
	}

	bool operator==(const Domain &other) const noexcept {
		return this == &other;
	}
};

#endif
