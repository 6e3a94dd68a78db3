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
#include <bolt/core/result.hpp>
#include <bolt/crypto/bls.hpp>
#include <bolt/crypto/chain.hpp>
#include <bolt/crypto/signing.hpp>
#include <bolt/delegation/config.hpp>

#include <cstdint>
#include <string_view>

BOLT_DELEGATION_NAMESPACE_BEGIN

enum class Action : uint8_t
{
    Delegate = 0,
    Revoke = 1,
};

Result<Action> to_action(uint64_t);

std::string_view action_name(Action) noexcept;

struct DelegationMessage
{
    Action action{Action::Delegate};
    uint64_t chain_id{0};
    crypto::BlsPubkeyBytes validator_pubkey{};
    crypto::BlsPubkeyBytes delegatee_pubkey{};
    crypto::BlsSignatureBytes signature{};

    friend bool
    operator==(DelegationMessage const &, DelegationMessage const &) = default;
};

// action (1) || chain id (8, big endian) || validator (48) || delegatee (48)
inline constexpr size_t DELEGATION_PAYLOAD_SIZE =
    1 + sizeof(uint64_t) + 2 * crypto::BLS_PUBKEY_SIZE;

using DelegationPayload = byte_string_fixed<DELEGATION_PAYLOAD_SIZE>;

DelegationPayload encode_payload(DelegationMessage const &);

// the signature of the result is left empty
Result<DelegationMessage> decode_payload(byte_string_view);

// sha256 of the payload
bytes32_t digest(DelegationMessage const &);

// what the validator key signs: the digest under the delegation domain
crypto::SigningRequest
signing_request(DelegationMessage const &, crypto::Chain);

BOLT_DELEGATION_NAMESPACE_END
