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

#include <bolt/core/keccak.hpp>
#include <bolt/crypto/bls.hpp>
#include <bolt/crypto/config.hpp>

#include <openssl/crypto.h>

#include <algorithm>
#include <cstdint>
#include <optional>

BOLT_CRYPTO_NAMESPACE_BEGIN

Address pubkey_hash(byte_string_fixed<96> const &serialized_pubkey)
{
    Address hash{};
    auto const digest = keccak256(to_byte_string_view(serialized_pubkey));
    std::copy_n(digest.bytes + 12, sizeof(Address), hash.bytes);
    return hash;
}

bool BlsSignature::verify(
    BlsPubkey const &pubkey, byte_string_view const message) const noexcept
{
    BLST_ERROR const result = blst_core_verify_pk_in_g1(
        &pubkey.get(),
        &sig_,
        true, // hash-to-curve
        message.data(),
        message.size(),
        reinterpret_cast<uint8_t const *>(BLS_SIGNATURE_DST),
        sizeof(BLS_SIGNATURE_DST) - 1,
        nullptr, // no augmentation
        0);
    return result == BLST_SUCCESS;
}

BlsSecretKey::BlsSecretKey(BlsSecretKey &&other) noexcept
    : sk_{other.sk_}
{
    OPENSSL_cleanse(&other.sk_, sizeof(other.sk_));
}

BlsSecretKey &BlsSecretKey::operator=(BlsSecretKey &&other) noexcept
{
    if (this != &other) {
        sk_ = other.sk_;
        OPENSSL_cleanse(&other.sk_, sizeof(other.sk_));
    }
    return *this;
}

BlsSecretKey::~BlsSecretKey()
{
    OPENSSL_cleanse(&sk_, sizeof(sk_));
}

std::optional<BlsSecretKey>
BlsSecretKey::from_bytes(byte_string_view const bytes) noexcept
{
    if (bytes.size() != BLS_SECRET_KEY_SIZE) {
        return std::nullopt;
    }
    BlsSecretKey key;
    blst_scalar_from_bendian(&key.sk_, bytes.data());
    if (!blst_sk_check(&key.sk_)) {
        return std::nullopt;
    }
    return key;
}

std::optional<BlsSecretKey>
BlsSecretKey::from_ikm(byte_string_view const ikm) noexcept
{
    if (ikm.size() < 32) {
        return std::nullopt;
    }
    BlsSecretKey key;
    blst_keygen(&key.sk_, ikm.data(), ikm.size(), nullptr, 0);
    return key;
}

BlsPubkeyBytes BlsSecretKey::public_key() const noexcept
{
    blst_p1 pk;
    blst_sk_to_pk_in_g1(&pk, &sk_);
    BlsPubkeyBytes compressed;
    blst_p1_compress(compressed.data(), &pk);
    return compressed;
}

byte_string_fixed<BLS_SECRET_KEY_SIZE> BlsSecretKey::to_bytes() const noexcept
{
    byte_string_fixed<BLS_SECRET_KEY_SIZE> out;
    blst_bendian_from_scalar(out.data(), &sk_);
    return out;
}

BlsSignatureBytes BlsSecretKey::sign(byte_string_view const message) const
    noexcept
{
    blst_p2 hash;
    blst_hash_to_g2(
        &hash,
        message.data(),
        message.size(),
        reinterpret_cast<uint8_t const *>(BLS_SIGNATURE_DST),
        sizeof(BLS_SIGNATURE_DST) - 1,
        nullptr,
        0);
    blst_p2 sig;
    blst_sign_pk_in_g1(&sig, &hash, &sk_);
    BlsSignatureBytes compressed;
    blst_p2_compress(compressed.data(), &sig);
    return compressed;
}

BOLT_CRYPTO_NAMESPACE_END
