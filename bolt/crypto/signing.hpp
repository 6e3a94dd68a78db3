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
#include <bolt/crypto/chain.hpp>
#include <bolt/crypto/config.hpp>

BOLT_CRYPTO_NAMESPACE_BEGIN

using DomainType = byte_string_fixed<4>;

// Each signing purpose gets its own domain type so a signature produced for
// one purpose never verifies for another.
inline constexpr DomainType DOMAIN_COMMITMENT{0x6d, 0x6d, 0x6f, 0x43};
inline constexpr DomainType DOMAIN_DELEGATION{0x62, 0x6f, 0x6c, 0x01};
inline constexpr DomainType DOMAIN_REGISTRATION{0x62, 0x6f, 0x6c, 0x02};

// What a key source is asked to sign: the signer derives the signing root
// from both halves, so a remote signer can check the domain on its own.
struct SigningRequest
{
    bytes32_t object_root{};
    bytes32_t domain{};
};

bytes32_t sha256(byte_string_view);

// hash_tree_root(ForkData{version, genesis_validators_root = 0})
bytes32_t compute_fork_data_root(ForkVersion const &);

// domain_type || fork_data_root[0..28]
bytes32_t compute_domain(DomainType const &, Chain);

// hash_tree_root(SigningData{object_root, domain})
bytes32_t
compute_signing_root(bytes32_t const &object_root, bytes32_t const &domain);

inline bytes32_t compute_signing_root(SigningRequest const &request)
{
    return compute_signing_root(request.object_root, request.domain);
}

BOLT_CRYPTO_NAMESPACE_END
