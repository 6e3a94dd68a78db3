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

#include <bolt/core/address.hpp>
#include <bolt/core/byte_string.hpp>
#include <bolt/crypto/config.hpp>

#include <blst.h>

#include <optional>

BOLT_CRYPTO_NAMESPACE_BEGIN

inline constexpr size_t BLS_PUBKEY_SIZE = 48;
inline constexpr size_t BLS_SIGNATURE_SIZE = 96;
inline constexpr size_t BLS_SECRET_KEY_SIZE = 32;

using BlsPubkeyBytes = byte_string_fixed<BLS_PUBKEY_SIZE>;
using BlsSignatureBytes = byte_string_fixed<BLS_SIGNATURE_SIZE>;

// proof of possession ciphersuite, shared by every signature in the system
inline constexpr char BLS_SIGNATURE_DST[] =
    "BLS_SIG_BLS12381G2_XMD:SHA-256_SSWU_RO_POP_";

// last 20 bytes of keccak256 over the 96 byte uncompressed G1 point
Address pubkey_hash(byte_string_fixed<96> const &serialized_pubkey);

class BlsPubkey
{
    blst_p1_affine pubkey_;
    BLST_ERROR parse_result_;

public:
    explicit BlsPubkey(BlsPubkeyBytes const &compressed)
    {
        parse_result_ = blst_p1_uncompress(&pubkey_, compressed.data());
    }

    bool is_valid() const noexcept
    {
        // NOTE: deserializing already checks the point is on the curve
        return parse_result_ == BLST_SUCCESS &&
               blst_p1_affine_in_g1(&pubkey_) &&
               !blst_p1_affine_is_inf(&pubkey_);
    }

    byte_string_fixed<96> serialize() const noexcept
    {
        byte_string_fixed<96> serialized;
        blst_p1_affine_serialize(serialized.data(), &pubkey_);
        return serialized;
    }

    blst_p1_affine const &get() const noexcept
    {
        return pubkey_;
    }
};

class BlsSignature
{
    blst_p2_affine sig_;
    BLST_ERROR parse_result_;

public:
    explicit BlsSignature(BlsSignatureBytes const &compressed)
    {
        parse_result_ = blst_p2_uncompress(&sig_, compressed.data());
    }

    bool is_valid() const noexcept
    {
        return parse_result_ == BLST_SUCCESS && blst_p2_affine_in_g2(&sig_) &&
               !blst_p2_affine_is_inf(&sig_);
    }

    bool verify(BlsPubkey const &, byte_string_view message) const noexcept;
};

/**
 * A BLS12-381 scalar. The key material is wiped when the object is
 * destroyed or moved from; it is never copied implicitly.
 */
class BlsSecretKey
{
    blst_scalar sk_;

    BlsSecretKey() = default;

public:
    BlsSecretKey(BlsSecretKey const &) = delete;
    BlsSecretKey &operator=(BlsSecretKey const &) = delete;
    BlsSecretKey(BlsSecretKey &&) noexcept;
    BlsSecretKey &operator=(BlsSecretKey &&) noexcept;
    ~BlsSecretKey();

    // big endian scalar; nullopt for zero or out of range
    static std::optional<BlsSecretKey>
    from_bytes(byte_string_view bytes) noexcept;

    // EIP-2333 key generation, ikm must be at least 32 bytes
    static std::optional<BlsSecretKey> from_ikm(byte_string_view ikm) noexcept;

    BlsPubkeyBytes public_key() const noexcept;

    // raw big endian scalar, for re-encryption into a keystore
    byte_string_fixed<BLS_SECRET_KEY_SIZE> to_bytes() const noexcept;

    BlsSignatureBytes sign(byte_string_view message) const noexcept;
};

BOLT_CRYPTO_NAMESPACE_END
