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

#include <bolt/core/byte_string.hpp>
#include <bolt/core/bytes.hpp>
#include <bolt/crypto/bls.hpp>
#include <bolt/crypto/chain.hpp>
#include <bolt/crypto/signing.hpp>
#include <bolt/delegation/config.hpp>
#include <bolt/delegation/message.hpp>

#include <cstdint>

BOLT_DELEGATION_NAMESPACE_BEGIN

namespace test
{
    inline crypto::BlsSecretKey make_key(uint8_t const seed)
    {
        return crypto::BlsSecretKey::from_ikm(byte_string(32, seed)).value();
    }

    inline DelegationMessage make_message(
        crypto::BlsSecretKey const &validator,
        crypto::BlsPubkeyBytes const &delegatee, Action const action,
        crypto::Chain const chain)
    {
        DelegationMessage message{
            .action = action,
            .chain_id = crypto::chain_id(chain),
            .validator_pubkey = validator.public_key(),
            .delegatee_pubkey = delegatee};
        auto const root =
            crypto::compute_signing_root(signing_request(message, chain));
        message.signature = validator.sign(to_byte_string_view(root));
        return message;
    }
}

BOLT_DELEGATION_NAMESPACE_END
