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
#include <bolt/core/bytes.hpp>
#include <bolt/registry/config.hpp>
#include <bolt/registry/contract/log.hpp>
#include <bolt/registry/contract/checkpointed.hpp>

#include <ankerl/unordered_dense.h>

#include <vector>

BOLT_REGISTRY_NAMESPACE_BEGIN

/**
 * Storage and event log of the contracts hosted in one chain state.
 *
 * Every contract address owns a sparse map of 32-byte slots; absent slots
 * read as zero. push() opens a checkpoint; pop_accept() folds everything
 * written since into the enclosing level and pop_reject() discards it, so
 * a failed call can be undone without leaving partial writes behind.
 */
class ContractState
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    using Storage = Map<bytes32_t, bytes32_t>;

    Map<Address, Checkpointed<Storage>> current_{};

    Checkpointed<std::vector<Log>> logs_{std::vector<Log>{}};

    unsigned version_{0};

public:
    ContractState() = default;

    ContractState(ContractState &&) = delete;
    ContractState(ContractState const &) = delete;
    ContractState &operator=(ContractState &&) = delete;
    ContractState &operator=(ContractState const &) = delete;

    unsigned version() const noexcept
    {
        return version_;
    }

    void push();

    void pop_accept();

    void pop_reject();

    ////////////////////////////////////////

    bytes32_t get_storage(Address const &, bytes32_t const &key) const;

    void
    set_storage(Address const &, bytes32_t const &key, bytes32_t const &value);

    // number of non-zero slots held by the address
    size_t storage_size(Address const &) const;

    ////////////////////////////////////////

    std::vector<Log> const &logs() const;

    void store_log(Log const &);
};

BOLT_REGISTRY_NAMESPACE_END
