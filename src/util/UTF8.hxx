// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef UTF8_HXX
#define UTF8_HXX

#include <string_view>

/**
 * Is this a valid UTF-8 string?  Null bytes are allowed.
 */
[[gnu::pure]]
bool
ValidateUTF8(std::string_view s) noexcept;

#endif
