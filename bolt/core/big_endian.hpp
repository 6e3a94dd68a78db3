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

#include <bolt/core/config.hpp>
#include <bolt/core/int.hpp>
#include <bolt/core/unaligned.hpp>

#include <intx/intx.hpp>

#include <algorithm>
#include <bit>
#include <cstdint>
#include <type_traits>

BOLT_NAMESPACE_BEGIN

// Unsigned integer stored as big endian bytes with alignment 1, so it can be
// laid out verbatim in wire payloads and storage slots.
template <typename T>
    requires(unsigned_integral<T>)
struct BigEndian
{
    using native_type = T;

    unsigned char bytes[sizeof(T)];

    BigEndian() = default;

    constexpr BigEndian(T const &x) noexcept
    {
        unaligned_store(bytes, intx::bswap(x));
    }

    constexpr bool operator==(BigEndian<T> const &other) const noexcept
    {
        return std::ranges::equal(bytes, other.bytes);
    }

    [[nodiscard]] constexpr native_type native() const noexcept
    {
        return intx::bswap(std::bit_cast<native_type>(bytes));
    }

    constexpr BigEndian<T> &operator=(T const &x) noexcept
    {
        unaligned_store(bytes, intx::bswap(x));
        return *this;
    }
};

using u64_be = BigEndian<uint64_t>;
using u256_be = BigEndian<uint256_t>;

static_assert(sizeof(u64_be) == sizeof(uint64_t));
static_assert(alignof(u64_be) == 1);
static_assert(sizeof(u256_be) == sizeof(uint256_t));
static_assert(alignof(u256_be) == 1);

template <typename T>
struct is_big_endian_wrapper : std::false_type
{
};

template <typename U>
struct is_big_endian_wrapper<BigEndian<U>> : std::true_type
{
};

template <typename T>
concept BigEndianType = is_big_endian_wrapper<T>::value;

BOLT_NAMESPACE_END
