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

#include <bolt/core/hex.hpp>
#include <bolt/delegation/config.hpp>
#include <bolt/delegation/delegation_error.hpp>
#include <bolt/delegation/message.hpp>
#include <bolt/delegation/signer.hpp>
#include <bolt/delegation/verifier.hpp>
#include <bolt/keys/key_source.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

BOLT_DELEGATION_NAMESPACE_BEGIN

Result<std::vector<DelegationMessage>> sign_delegations(
    keys::KeySource &source, crypto::BlsPubkeyBytes const &delegatee,
    Action const action, crypto::Chain const chain)
{
    if (!crypto::BlsPubkey{delegatee}.is_valid()) {
        return DelegationError::MalformedPoint;
    }

    DelegationVerifier const verifier{chain};
    auto const validators = keys::public_keys(source);
    std::vector<DelegationMessage> messages;
    messages.reserve(validators.size());

    for (auto const &validator : validators) {
        DelegationMessage message{
            .action = action,
            .chain_id = crypto::chain_id(chain),
            .validator_pubkey = validator,
            .delegatee_pubkey = delegatee};
        BOOST_OUTCOME_TRY(
            auto const signature,
            keys::sign(source, validator, signing_request(message, chain)));
        message.signature = signature;

        auto const verdict = verifier.verify(message);
        if (verdict.has_error()) {
            LOG_ERROR(
                "generated {} for {} does not verify: {}",
                action_name(action),
                to_hex(to_byte_string_view(validator)),
                verdict.error().message().c_str());
            return DelegationError::BadSignature;
        }
        messages.push_back(message);
    }

    LOG_INFO(
        "signed {} {} messages for delegatee {}",
        messages.size(),
        action_name(action),
        to_hex(to_byte_string_view(delegatee)));
    return messages;
}

BOLT_DELEGATION_NAMESPACE_END
