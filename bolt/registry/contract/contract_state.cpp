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

#include <bolt/core/address.hpp>
#include <bolt/core/assert.h>
#include <bolt/core/bytes.hpp>
#include <bolt/registry/config.hpp>
#include <bolt/registry/contract/contract_state.hpp>
#include <bolt/registry/contract/log.hpp>

#include <utility>
#include <vector>

BOLT_REGISTRY_NAMESPACE_BEGIN

void ContractState::push()
{
    ++version_;
}

void ContractState::pop_accept()
{
    BOLT_ASSERT(version_);

    for (auto &it : current_) {
        it.second.accept(version_);
    }

    logs_.accept(version_);

    --version_;
}

void ContractState::pop_reject()
{
    BOLT_ASSERT(version_);

    std::vector<Address> removals;

    for (auto &it : current_) {
        if (it.second.reject(version_)) {
            removals.push_back(it.first);
        }
    }

    logs_.reject(version_);

    while (removals.size()) {
        current_.erase(removals.back());
        removals.pop_back();
    }

    --version_;
}

bytes32_t
ContractState::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const it = current_.find(address);
    if (it == current_.end()) {
        return {};
    }
    auto const &storage = it->second.recent();
    auto const it2 = storage.find(key);
    if (it2 == storage.end()) {
        return {};
    }
    return it2->second;
}

void ContractState::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    auto it = current_.find(address);
    if (it == current_.end()) {
        it = current_.try_emplace(address, Storage{}, version_).first;
    }
    auto &storage = it->second.current(version_);
    if (value == bytes32_t{}) {
        storage.erase(key);
    }
    else {
        storage.insert_or_assign(key, value);
    }
}

size_t ContractState::storage_size(Address const &address) const
{
    auto const it = current_.find(address);
    return it == current_.end() ? 0 : it->second.recent().size();
}

std::vector<Log> const &ContractState::logs() const
{
    return logs_.recent();
}

void ContractState::store_log(Log const &log)
{
    auto &logs = logs_.current(version_);
    logs.push_back(log);
}

BOLT_REGISTRY_NAMESPACE_END
