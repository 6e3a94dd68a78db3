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
#include <bolt/keys/config.hpp>
#include <bolt/keys/dirk_transport.hpp>
#include <bolt/keys/key_error.hpp>
#include <bolt/keys/key_source.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <openssl/crypto.h>
#include <quill/Quill.h>

#include <algorithm>
#include <utility>

BOLT_KEYS_NAMESPACE_BEGIN

SecretKeys::SecretKeys(std::vector<crypto::BlsSecretKey> keys)
    : keys_{std::move(keys)}
{
}

Result<SecretKeys> SecretKeys::from_hex(std::vector<std::string> const &hex)
{
    std::vector<crypto::BlsSecretKey> keys;
    keys.reserve(hex.size());
    for (auto const &h : hex) {
        auto bytes = parse_hex(h);
        if (!bytes.has_value()) {
            return KeyError::InvalidSecretKey;
        }
        auto key = crypto::BlsSecretKey::from_bytes(*bytes);
        OPENSSL_cleanse(bytes->data(), bytes->size());
        if (!key.has_value()) {
            return KeyError::InvalidSecretKey;
        }
        keys.push_back(std::move(*key));
    }
    return SecretKeys{std::move(keys)};
}

std::vector<crypto::BlsPubkeyBytes> SecretKeys::public_keys() const
{
    std::vector<crypto::BlsPubkeyBytes> pubkeys;
    pubkeys.reserve(keys_.size());
    for (auto const &key : keys_) {
        pubkeys.push_back(key.public_key());
    }
    return pubkeys;
}

Result<crypto::BlsSignatureBytes> SecretKeys::sign(
    crypto::BlsPubkeyBytes const &pubkey,
    crypto::SigningRequest const &request) const
{
    for (auto const &key : keys_) {
        if (key.public_key() == pubkey) {
            auto const root = crypto::compute_signing_root(request);
            return key.sign(to_byte_string_view(root));
        }
    }
    return KeyError::UnknownKeyError;
}

LocalKeystore::LocalKeystore(
    SecretKeys keys, std::vector<KeystoreFailure> failures)
    : keys_{std::move(keys)}
    , failures_{std::move(failures)}
{
}

Result<LocalKeystore> LocalKeystore::load(KeystoreConfig const &config)
{
    BOOST_OUTCOME_TRY(auto loaded, load_keystores(config));
    return LocalKeystore{
        SecretKeys{std::move(loaded.keys)}, std::move(loaded.failures)};
}

std::vector<crypto::BlsPubkeyBytes> public_keys(KeySource const &source)
{
    return std::visit(
        [](auto const &s) { return s.public_keys(); }, source);
}

Result<crypto::BlsSignatureBytes> sign(
    KeySource &source, crypto::BlsPubkeyBytes const &pubkey,
    crypto::SigningRequest const &request)
{
    return std::visit(
        [&](auto &s) -> Result<crypto::BlsSignatureBytes> {
            return s.sign(pubkey, request);
        },
        source);
}

Result<KeySource> make_key_source(KeySourceConfig const &config)
{
    BOOST_OUTCOME_TRY(validate(config));

    if (!config.secret_keys.empty()) {
        BOOST_OUTCOME_TRY(auto keys, SecretKeys::from_hex(config.secret_keys));
        LOG_INFO("using {} secret keys", config.secret_keys.size());
        return KeySource{std::move(keys)};
    }
    if (config.keystore.has_value()) {
        BOOST_OUTCOME_TRY(auto keystore, LocalKeystore::load(*config.keystore));
        return KeySource{std::move(keystore)};
    }
    auto const &remote = *config.remote_signer;
    BOOST_OUTCOME_TRY(auto transport, DirkTransport::connect(remote));
    BOOST_OUTCOME_TRY(
        auto signer,
        RemoteSigner::connect(
            std::move(transport), remote.wallet_path, remote.passphrases));
    return KeySource{std::move(signer)};
}

BOLT_KEYS_NAMESPACE_END
