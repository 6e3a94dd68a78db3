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

#include <bolt/core/assert.h>
#include <bolt/core/byte_string.hpp>
#include <bolt/core/config.hpp>
#include <bolt/core/int.hpp>

#include <evmc/evmc.hpp>

#include <algorithm>
#include <bit>
#include <cstddef>
#include <functional>

BOLT_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

constexpr bytes32_t to_bytes(byte_string_view const data) noexcept
{
    BOLT_ASSERT(data.size() <= sizeof(bytes32_t));

    bytes32_t byte;
    std::copy_n(
        data.begin(),
        data.size(),
        byte.bytes + sizeof(bytes32_t) - data.size());
    return byte;
}

constexpr byte_string_view to_byte_string_view(bytes32_t const &b) noexcept
{
    return {b.bytes, sizeof(bytes32_t)};
}

using namespace evmc::literals;

BOLT_NAMESPACE_END
