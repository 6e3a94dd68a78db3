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

#include <bolt/core/bytes.hpp>
#include <bolt/crypto/chain.hpp>
#include <bolt/crypto/config.hpp>
#include <bolt/crypto/signing.hpp>

#include <blst.h>

#include <algorithm>

BOLT_CRYPTO_NAMESPACE_BEGIN

bytes32_t sha256(byte_string_view const data)
{
    bytes32_t digest;
    blst_sha256(digest.bytes, data.data(), data.size());
    return digest;
}

bytes32_t compute_fork_data_root(ForkVersion const &version)
{
    byte_string_fixed<64> leaves{};
    std::copy(version.begin(), version.end(), leaves.begin());
    return sha256(to_byte_string_view(leaves));
}

bytes32_t compute_domain(DomainType const &type, Chain const chain)
{
    auto const fork_data_root = compute_fork_data_root(fork_version(chain));
    bytes32_t domain;
    std::copy(type.begin(), type.end(), domain.bytes);
    std::copy_n(
        fork_data_root.bytes,
        sizeof(bytes32_t) - type.size(),
        domain.bytes + type.size());
    return domain;
}

bytes32_t
compute_signing_root(bytes32_t const &object_root, bytes32_t const &domain)
{
    byte_string_fixed<64> leaves;
    std::copy_n(object_root.bytes, 32, leaves.begin());
    std::copy_n(domain.bytes, 32, leaves.begin() + 32);
    return sha256(to_byte_string_view(leaves));
}

BOLT_CRYPTO_NAMESPACE_END
