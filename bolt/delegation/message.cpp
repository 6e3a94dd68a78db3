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

#include <bolt/core/big_endian.hpp>
#include <bolt/core/unaligned.hpp>
#include <bolt/crypto/signing.hpp>
#include <bolt/delegation/config.hpp>
#include <bolt/delegation/delegation_error.hpp>
#include <bolt/delegation/message.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>

BOLT_DELEGATION_NAMESPACE_BEGIN

Result<Action> to_action(uint64_t const value)
{
    switch (value) {
    case static_cast<uint64_t>(Action::Delegate):
        return Action::Delegate;
    case static_cast<uint64_t>(Action::Revoke):
        return Action::Revoke;
    default:
        return DelegationError::UnknownAction;
    }
}

std::string_view action_name(Action const action) noexcept
{
    return action == Action::Delegate ? "delegate" : "revoke";
}

DelegationPayload encode_payload(DelegationMessage const &message)
{
    DelegationPayload payload;
    auto *p = payload.data();
    *p++ = static_cast<unsigned char>(message.action);
    unaligned_store(p, u64_be{message.chain_id});
    p += sizeof(u64_be);
    p = std::copy(
        message.validator_pubkey.begin(), message.validator_pubkey.end(), p);
    std::copy(
        message.delegatee_pubkey.begin(), message.delegatee_pubkey.end(), p);
    return payload;
}

Result<DelegationMessage> decode_payload(byte_string_view const payload)
{
    if (payload.size() != DELEGATION_PAYLOAD_SIZE) {
        return DelegationError::MalformedRecord;
    }
    auto const *p = payload.data();
    BOOST_OUTCOME_TRY(auto const action, to_action(*p++));
    DelegationMessage message{.action = action};
    message.chain_id = unaligned_load<u64_be>(p).native();
    p += sizeof(u64_be);
    std::copy_n(p, crypto::BLS_PUBKEY_SIZE, message.validator_pubkey.data());
    p += crypto::BLS_PUBKEY_SIZE;
    std::copy_n(p, crypto::BLS_PUBKEY_SIZE, message.delegatee_pubkey.data());
    return message;
}

bytes32_t digest(DelegationMessage const &message)
{
    auto const payload = encode_payload(message);
    return crypto::sha256(to_byte_string_view(payload));
}

crypto::SigningRequest signing_request(
    DelegationMessage const &message, crypto::Chain const chain)
{
    return {
        .object_root = digest(message),
        .domain = crypto::compute_domain(crypto::DOMAIN_DELEGATION, chain)};
}

BOLT_DELEGATION_NAMESPACE_END
