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

#include <gtest/gtest.h>

#include <eva/core/byte_string.hpp>
#include <eva/core/hex_literal.hpp>
#include <eva/core/test_util/gtest_logging_environment.hpp> // NOLINT

using namespace ::eva::literals;

TEST(HexLiteralTest, variable_length_hex)
{
    EXPECT_EQ((0x60015b_hex).size(), 3);
    EXPECT_EQ(0x60015b_hex, eva::byte_string({0x60, 0x01, 0x5b}));

    EXPECT_EQ(
        (0x7f0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20_hex)
            .size(),
        33);
}

TEST(HexLiteralTest, leading_zero_bytes_are_kept)
{
    EXPECT_EQ(0x0000_hex, eva::byte_string({0x00, 0x00}));
    EXPECT_EQ(0x005b_hex, eva::byte_string({0x00, 0x5b}));
}

TEST(HexLiteralTest, odd_number_of_nibbles)
{
    EXPECT_EQ(0x123_hex, eva::byte_string({0x01, 0x23}));
    EXPECT_EQ(0x0_hex, eva::byte_string({0x00}));
}

TEST(HexLiteralTest, mixed_case)
{
    EXPECT_EQ(0xAbCd_hex, eva::byte_string({0xab, 0xcd}));
}

TEST(HexLiteralTest, from_hex)
{
    EXPECT_EQ(eva::from_hex(""), eva::byte_string{});
    EXPECT_EQ(eva::from_hex("0x"), eva::byte_string{});
    EXPECT_EQ(eva::from_hex("5b"), eva::byte_string({0x5b}));
    EXPECT_EQ(eva::from_hex("0X5B00"), eva::byte_string({0x5b, 0x00}));
    EXPECT_EQ(eva::from_hex("0xzz"), eva::byte_string{});
    EXPECT_EQ(eva::from_hex("6g"), eva::byte_string{});
}
