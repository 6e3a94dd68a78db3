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
#include <bolt/crypto/chain.hpp>
#include <bolt/delegation/config.hpp>
#include <bolt/delegation/message.hpp>

BOLT_DELEGATION_NAMESPACE_BEGIN

/**
 * The single verification routine for delegation and revocation messages.
 * Both the registry and the delegation store call it, so they always reach
 * the same verdict for the same input.
 *
 * Checks, in order:
 *  - both public keys and the signature decode to valid, non-identity
 *    points of their subgroups (MalformedPoint)
 *  - the message targets the verifier's chain (WrongChain)
 *  - the signature is the validator key's signature over the message's
 *    signing root in the delegation domain (BadSignature)
 */
class DelegationVerifier
{
    crypto::Chain chain_;

public:
    explicit DelegationVerifier(crypto::Chain const chain)
        : chain_{chain}
    {
    }

    crypto::Chain chain() const noexcept
    {
        return chain_;
    }

    Result<void> verify(DelegationMessage const &) const;
};

BOLT_DELEGATION_NAMESPACE_END
