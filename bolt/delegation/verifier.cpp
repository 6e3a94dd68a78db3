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

#include <bolt/crypto/bls.hpp>
#include <bolt/crypto/signing.hpp>
#include <bolt/delegation/config.hpp>
#include <bolt/delegation/delegation_error.hpp>
#include <bolt/delegation/message.hpp>
#include <bolt/delegation/verifier.hpp>

#include <boost/outcome/success_failure.hpp>

BOLT_DELEGATION_NAMESPACE_BEGIN

Result<void> DelegationVerifier::verify(DelegationMessage const &message) const
{
    crypto::BlsPubkey const validator{message.validator_pubkey};
    crypto::BlsPubkey const delegatee{message.delegatee_pubkey};
    crypto::BlsSignature const signature{message.signature};
    if (!validator.is_valid() || !delegatee.is_valid() ||
        !signature.is_valid()) {
        return DelegationError::MalformedPoint;
    }

    if (message.chain_id != crypto::chain_id(chain_)) {
        return DelegationError::WrongChain;
    }

    auto const root =
        crypto::compute_signing_root(signing_request(message, chain_));
    if (!signature.verify(validator, to_byte_string_view(root))) {
        return DelegationError::BadSignature;
    }
    return outcome::success();
}

BOLT_DELEGATION_NAMESPACE_END
