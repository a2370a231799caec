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

#include <eva/core/byte_string.hpp>
#include <eva/core/config.hpp>

#include <string_view>

EVA_NAMESPACE_BEGIN

inline constexpr unsigned char from_hex_digit(char const h)
{
    if (h >= '0' && h <= '9') {
        return static_cast<unsigned char>(h - '0');
    }
    if (h >= 'a' && h <= 'f') {
        return static_cast<unsigned char>(h - 'a' + 10);
    }
    if (h >= 'A' && h <= 'F') {
        return static_cast<unsigned char>(h - 'A' + 10);
    }
    return 0xff;
}

/// Decode a hex string, with or without a leading `0x`. An odd number of
/// digits is read as if a leading zero were present. Any non-hex digit
/// yields an empty result.
inline constexpr byte_string from_hex(std::string_view s)
{
    if (s.starts_with("0x") || s.starts_with("0X")) {
        s.remove_prefix(2);
    }

    byte_string out;
    out.reserve((s.size() + 1) / 2);

    std::size_t i = 0;
    if (s.size() % 2 == 1) {
        auto const lo = from_hex_digit(s[0]);
        if (lo == 0xff) {
            return {};
        }
        out.push_back(lo);
        i = 1;
    }

    for (; i < s.size(); i += 2) {
        auto const hi = from_hex_digit(s[i]);
        auto const lo = from_hex_digit(s[i + 1]);
        if (hi == 0xff || lo == 0xff) {
            return {};
        }
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }

    return out;
}

namespace literals
{
    /// `0x60015b_hex` is the byte string {0x60, 0x01, 0x5b}.
    constexpr byte_string operator""_hex(char const *s) noexcept
    {
        return from_hex(s);
    }
}

EVA_NAMESPACE_END
