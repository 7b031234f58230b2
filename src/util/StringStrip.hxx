// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <string_view>

/**
 * Skips whitespace at the beginning of the string.
 */
[[gnu::pure]]
std::string_view
StripLeft(std::string_view s) noexcept;

/**
 * Skips whitespace at the end of the string.
 */
[[gnu::pure]]
std::string_view
StripRight(std::string_view s) noexcept;

[[gnu::pure]]
std::string_view
Strip(std::string_view s) noexcept;
