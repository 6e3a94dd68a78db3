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

#include <bolt/core/bytes.hpp>
#include <bolt/registry/config.hpp>

#include <bit>
#include <cstdint>
#include <span>
#include <string_view>

#include <cthash/sha3/common.hpp>

namespace cthash
{
    struct keccak_config
    {
        static constexpr size_t digest_length_bit = 256u;
        static constexpr size_t capacity_bit = 512u;
        static constexpr size_t rate_bit = 1600u - capacity_bit;

        // original keccak padding, domain bit 0x01 rather than sha3's 0x06
        static constexpr auto suffix = keccak_suffix(0, 0x00);
    };

    static_assert(
        keccak_config::rate_bit + keccak_config::capacity_bit == 1600u);

    using keccak_256 = keccak_hasher<keccak_config>;
}

BOLT_REGISTRY_NAMESPACE_BEGIN

consteval uint32_t abi_encode_selector(std::string_view const function_name)
{
    auto const h =
        cthash::keccak_256{}.update(std::span{function_name}).final();

    return (static_cast<uint32_t>(h[0]) << 24) |
           (static_cast<uint32_t>(h[1]) << 16) |
           (static_cast<uint32_t>(h[2]) << 8) | static_cast<uint32_t>(h[3]);
}

consteval bytes32_t
abi_encode_event_signature(std::string_view const event_name)
{
    auto const h = cthash::keccak_256{}.update(std::span{event_name}).final();
    return std::bit_cast<bytes32_t>(h);
}

BOLT_REGISTRY_NAMESPACE_END
