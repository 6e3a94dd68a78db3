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

#include <bolt/core/big_endian.hpp>
#include <bolt/registry/config.hpp>
#include <bolt/registry/contract/storage_variable.hpp>

#include <intx/intx.hpp>

#include <cstdint>

BOLT_REGISTRY_NAMESPACE_BEGIN

/**
 * Append-only array in storage: the length lives at the base slot,
 * elements follow it back to back.
 */
template <typename T>
    requires std::has_unique_object_representations_v<T>
class StorageArray
{
    ContractState &state_;
    Address const &address_;
    StorageVariable<u64_be> length_;
    uint256_t const start_index_;

    static constexpr size_t SLOT_PER_ELEM = StorageVariable<T>::N;

public:
    StorageArray(
        ContractState &state, Address const &address, bytes32_t const &slot)
        : state_{state}
        , address_{address}
        , length_{StorageVariable<u64_be>(state, address, slot)}
        , start_index_{intx::be::load<uint256_t>(slot) + 1}
    {
    }

    uint64_t length() const noexcept
    {
        return length_.load().native();
    }

    StorageVariable<T> get(uint64_t const index) const noexcept
    {
        uint256_t const offset = start_index_ + index * SLOT_PER_ELEM;
        return StorageVariable<T>{state_, address_, offset};
    }

    void push(T const &value) noexcept
    {
        auto const len = length();
        get(len).store(value);
        length_.store(len + 1);
    }
};

BOLT_REGISTRY_NAMESPACE_END
