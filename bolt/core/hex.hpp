// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <bolt/core/byte_string.hpp>
#include <bolt/core/config.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

BOLT_NAMESPACE_BEGIN

inline constexpr unsigned char from_hex_digit(char const h)
{
    if (h >= '0' && h <= '9') {
        return static_cast<unsigned char>(h - '0');
    }
    else if (h >= 'a' && h <= 'f') {
        return static_cast<unsigned char>(h - 'a' + 10);
    }
    else if (h >= 'A' && h <= 'F') {
        return static_cast<unsigned char>(h - 'A' + 10);
    }
    else {
        return 0xff;
    }
}

// Accepts an optional 0x prefix. Odd length or a non hex digit is an error.
inline std::optional<byte_string> parse_hex(std::string_view s)
{
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s.remove_prefix(2);
    }
    if (s.size() % 2) {
        return std::nullopt;
    }
    byte_string r(s.size() / 2, static_cast<unsigned char>(0));
    for (size_t i = 0; i < r.size(); ++i) {
        auto const hi = from_hex_digit(s[2 * i]);
        auto const lo = from_hex_digit(s[2 * i + 1]);
        if (hi == 0xff || lo == 0xff) {
            return std::nullopt;
        }
        r[i] = static_cast<unsigned char>((hi << 4) | lo);
    }
    return r;
}

// Parses into a fixed width buffer, the length must match exactly.
template <size_t N>
std::optional<byte_string_fixed<N>> parse_hex_fixed(std::string_view const s)
{
    auto const bytes = parse_hex(s);
    if (!bytes.has_value() || bytes->size() != N) {
        return std::nullopt;
    }
    byte_string_fixed<N> r;
    std::copy_n(bytes->data(), N, r.data());
    return r;
}

inline std::string to_hex(byte_string_view const bytes)
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string r;
    r.reserve(2 + 2 * bytes.size());
    r += "0x";
    for (auto const b : bytes) {
        r += digits[b >> 4];
        r += digits[b & 0xf];
    }
    return r;
}

namespace literals
{
    inline byte_string operator""_hex(char const *s, size_t const n)
    {
        return parse_hex({s, n}).value();
    }
};

BOLT_NAMESPACE_END
