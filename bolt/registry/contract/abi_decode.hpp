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

#include <bolt/core/address.hpp>
#include <bolt/core/big_endian.hpp>
#include <bolt/core/byte_string.hpp>
#include <bolt/core/bytes.hpp>
#include <bolt/core/likely.h>
#include <bolt/core/math.hpp>
#include <bolt/core/result.hpp>
#include <bolt/registry/config.hpp>
#include <bolt/registry/contract/abi_decode_error.hpp>

#include <boost/outcome/try.hpp>

#include <cstring>
#include <type_traits>

BOLT_REGISTRY_NAMESPACE_BEGIN

template <typename T>
    requires(BigEndianType<T> || std::same_as<T, Address>)
Result<T> abi_decode_fixed(byte_string_view &enc)
{
    static_assert(sizeof(T) <= 32);
    if (BOLT_UNLIKELY(enc.size() < 32)) {
        return AbiDecodeError::InputTooShort;
    }

    constexpr size_t offset = 32 - sizeof(T);
    T output{};
    std::memcpy(&output, enc.data() + offset, sizeof(T));
    enc.remove_prefix(32);
    return output;
}

// length-prefixed tail of a dynamic `bytes` argument whose length is known
template <size_t N>
Result<byte_string_fixed<N>> abi_decode_bytes_tail(byte_string_view &enc)
{
    static_assert(N > 32, "bytesN (N<=32) belongs in head");

    BOOST_OUTCOME_TRY(auto const length, abi_decode_fixed<u256_be>(enc));
    if (BOLT_UNLIKELY(length.native() != N)) {
        return AbiDecodeError::LengthMismatch;
    }

    constexpr size_t padded = round_up(N, size_t{32});
    if (BOLT_UNLIKELY(enc.size() < padded)) {
        return AbiDecodeError::InputTooShort;
    }

    byte_string_fixed<N> output{};
    std::memcpy(output.data(), enc.data(), N);
    enc.remove_prefix(padded);
    return output;
}

BOLT_REGISTRY_NAMESPACE_END
