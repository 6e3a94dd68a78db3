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

#include <bolt/core/result.hpp>
#include <bolt/crypto/bls.hpp>
#include <bolt/crypto/chain.hpp>
#include <bolt/delegation/config.hpp>
#include <bolt/delegation/message.hpp>
#include <bolt/keys/key_source.hpp>

#include <vector>

BOLT_DELEGATION_NAMESPACE_BEGIN

/**
 * Builds and signs one message per public key of the key source, each
 * naming the same delegatee. Every signature is checked against the
 * verifier before it is returned, so an artifact never carries a message
 * the agent would drop.
 */
Result<std::vector<DelegationMessage>> sign_delegations(
    keys::KeySource &, crypto::BlsPubkeyBytes const &delegatee, Action,
    crypto::Chain);

BOLT_DELEGATION_NAMESPACE_END
