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

#include <bolt/core/fiber/priority_pool.hpp>
#include <bolt/core/result.hpp>
#include <bolt/crypto/bls.hpp>
#include <bolt/delegation/config.hpp>
#include <bolt/delegation/message.hpp>
#include <bolt/delegation/verifier.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

BOLT_DELEGATION_NAMESPACE_BEGIN

struct DroppedRecord
{
    size_t index;
    outcome_e::system_code error;
};

struct LoadReport
{
    size_t accepted{0};
    std::vector<DroppedRecord> dropped{};
    // revocations naming a delegatee that was not active at that point
    std::vector<size_t> ignored{};
};

/**
 * Off-chain view of which delegatee may sign commitments for a validator.
 *
 * Built once from the records of a delegation artifact. Every decoded
 * message is verified on the pool; records that fail to decode or verify
 * are dropped and reported, never fatal. Surviving messages are applied in
 * record order: a Delegate replaces the validator's delegatee, a Revoke
 * removes it only when it names the currently active delegatee. The last
 * applicable record for a validator therefore wins.
 */
class DelegationStore
{
    std::map<crypto::BlsPubkeyBytes, crypto::BlsPubkeyBytes> delegations_{};
    LoadReport report_{};

    DelegationStore() = default;

public:
    using Map = std::map<crypto::BlsPubkeyBytes, crypto::BlsPubkeyBytes>;

    static DelegationStore load(
        std::vector<Result<DelegationMessage>> records,
        DelegationVerifier const &, fiber::PriorityPool &);

    std::optional<crypto::BlsPubkeyBytes>
    resolve_signer(crypto::BlsPubkeyBytes const &validator) const;

    Map const &delegations() const noexcept
    {
        return delegations_;
    }

    LoadReport const &report() const noexcept
    {
        return report_;
    }
};

BOLT_DELEGATION_NAMESPACE_END
