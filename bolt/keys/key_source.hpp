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
#include <bolt/crypto/bls.hpp>
#include <bolt/crypto/signing.hpp>
#include <bolt/keys/config.hpp>
#include <bolt/keys/key_source_config.hpp>
#include <bolt/keys/keystore.hpp>
#include <bolt/keys/remote_signer.hpp>

#include <string>
#include <variant>
#include <vector>

BOLT_KEYS_NAMESPACE_BEGIN

// Raw secret keys held in memory.
class SecretKeys
{
    std::vector<crypto::BlsSecretKey> keys_;

public:
    explicit SecretKeys(std::vector<crypto::BlsSecretKey>);

    // hex encoded big endian scalars, 0x prefix optional
    static Result<SecretKeys> from_hex(std::vector<std::string> const &);

    std::vector<crypto::BlsPubkeyBytes> public_keys() const;

    Result<crypto::BlsSignatureBytes> sign(
        crypto::BlsPubkeyBytes const &, crypto::SigningRequest const &) const;
};

// Secret keys decrypted from an EIP-2335 keystore directory at start-up.
class LocalKeystore
{
    SecretKeys keys_;
    std::vector<KeystoreFailure> failures_;

    LocalKeystore(SecretKeys, std::vector<KeystoreFailure>);

public:
    static Result<LocalKeystore> load(KeystoreConfig const &);

    // entries skipped while loading
    std::vector<KeystoreFailure> const &failures() const noexcept
    {
        return failures_;
    }

    std::vector<crypto::BlsPubkeyBytes> public_keys() const
    {
        return keys_.public_keys();
    }

    Result<crypto::BlsSignatureBytes> sign(
        crypto::BlsPubkeyBytes const &pubkey,
        crypto::SigningRequest const &request) const
    {
        return keys_.sign(pubkey, request);
    }
};

using KeySource = std::variant<SecretKeys, LocalKeystore, RemoteSigner>;

std::vector<crypto::BlsPubkeyBytes> public_keys(KeySource const &);

Result<crypto::BlsSignatureBytes> sign(
    KeySource &, crypto::BlsPubkeyBytes const &,
    crypto::SigningRequest const &);

// Validates the configuration, then opens the selected source. A remote
// signer is reached through DirkTransport.
Result<KeySource> make_key_source(KeySourceConfig const &);

BOLT_KEYS_NAMESPACE_END
