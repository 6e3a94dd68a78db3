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

#include <bolt/core/byte_string.hpp>
#include <bolt/core/hex.hpp>

#include <gtest/gtest.h>

using namespace bolt;
using namespace bolt::literals;

TEST(Hex, parse)
{
    EXPECT_EQ(parse_hex("0x00ff10"), (byte_string{0x00, 0xff, 0x10}));
    EXPECT_EQ(parse_hex("00FF10"), (byte_string{0x00, 0xff, 0x10}));
    EXPECT_EQ(parse_hex("0x"), byte_string{});
    EXPECT_EQ(parse_hex(""), byte_string{});

    EXPECT_FALSE(parse_hex("0x0").has_value());
    EXPECT_FALSE(parse_hex("0xzz").has_value());
    EXPECT_FALSE(parse_hex("x0").has_value());
}

TEST(Hex, parse_fixed)
{
    auto const two = parse_hex_fixed<2>("0xabcd");
    ASSERT_TRUE(two.has_value());
    EXPECT_EQ((*two)[0], 0xab);
    EXPECT_EQ((*two)[1], 0xcd);

    EXPECT_FALSE(parse_hex_fixed<2>("0xab").has_value());
    EXPECT_FALSE(parse_hex_fixed<2>("0xabcdef").has_value());
}

TEST(Hex, to_hex)
{
    EXPECT_EQ(to_hex("0xdeadBEEF"_hex), "0xdeadbeef");
    EXPECT_EQ(to_hex({}), "0x");
}
