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
#include <bolt/core/bytes.hpp>
#include <bolt/core/int.hpp>
#include <bolt/core/unaligned.hpp>
#include <bolt/registry/config.hpp>
#include <bolt/registry/contract/contract_state.hpp>

#include <intx/intx.hpp>

#include <array>
#include <cstring>
#include <optional>
#include <type_traits>

BOLT_REGISTRY_NAMESPACE_BEGIN

/**
 * A trivially copyable value spread over consecutive storage slots starting
 * at a key. The tail of the last slot is zero padded.
 */
template <typename T>
    requires std::has_unique_object_representations_v<T>
class StorageVariable
{
public:
    static constexpr size_t N =
        (sizeof(T) + sizeof(bytes32_t) - 1) / sizeof(bytes32_t);
    using Slots = std::array<bytes32_t, N>;

    static Slots to_slots(T const &t)
    {
        Slots slots{};
        std::memcpy(&slots[0].bytes, &t, sizeof(T));
        return slots;
    }

    static T from_slots(Slots const &slots)
    {
        auto *const base = &slots[0].bytes[0];
        return unaligned_load<T>(base);
    }

private:
    void store_(Slots const &slots)
    {
        for (size_t i = 0; i < N; ++i) {
            state_.set_storage(
                address_, intx::be::store<bytes32_t>(offset_ + i), slots[i]);
        }
    }

    ContractState &state_;
    Address const &address_;
    uint256_t const offset_;

public:
    StorageVariable(
        ContractState &state, Address const &address, bytes32_t const &key)
        : state_{state}
        , address_{address}
        , offset_{intx::be::load<uint256_t>(key)}
    {
    }

    StorageVariable(
        ContractState &state, Address const &address, uint256_t const &key)
        : state_{state}
        , address_{address}
        , offset_{key}
    {
    }

    T load() const noexcept
    {
        Slots slots;
        for (size_t i = 0; i < N; ++i) {
            slots[i] = state_.get_storage(
                address_, intx::be::store<bytes32_t>(offset_ + i));
        }
        return from_slots(slots);
    }

    // nullopt when every slot is zero
    std::optional<T> load_checked() const noexcept
    {
        Slots slots;
        bool has_data = false;
        for (size_t i = 0; i < N; ++i) {
            slots[i] = state_.get_storage(
                address_, intx::be::store<bytes32_t>(offset_ + i));
            has_data |= (slots[i] != bytes32_t{});
        }
        return has_data ? from_slots(slots) : std::optional<T>{};
    }

    void store(T const &value)
    {
        store_(to_slots(value));
    }
};

BOLT_REGISTRY_NAMESPACE_END
