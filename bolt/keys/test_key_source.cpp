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

#include <bolt/core/byte_string.hpp>
#include <bolt/core/config_error.hpp>
#include <bolt/core/hex.hpp>
#include <bolt/crypto/bls.hpp>
#include <bolt/crypto/signing.hpp>
#include <bolt/keys/key_error.hpp>
#include <bolt/keys/key_source.hpp>
#include <bolt/keys/key_source_config.hpp>
#include <bolt/keys/remote_signer.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace bolt;
using namespace bolt::keys;

namespace
{
    crypto::BlsSecretKey make_key(uint8_t const seed)
    {
        return crypto::BlsSecretKey::from_ikm(byte_string(32, seed)).value();
    }

    std::string secret_hex(uint8_t const seed)
    {
        return to_hex(to_byte_string_view(make_key(seed).to_bytes()));
    }

    crypto::SigningRequest request()
    {
        crypto::SigningRequest r;
        std::fill_n(r.object_root.bytes, 32, 0x42);
        r.domain =
            crypto::compute_domain(crypto::DOMAIN_DELEGATION, crypto::Chain::Holesky);
        return r;
    }

    bool verifies(
        crypto::BlsPubkeyBytes const &pubkey,
        crypto::BlsSignatureBytes const &signature,
        crypto::SigningRequest const &r)
    {
        auto const root = crypto::compute_signing_root(r);
        return crypto::BlsSignature{signature}.verify(
            crypto::BlsPubkey{pubkey}, to_byte_string_view(root));
    }

    // In-process stand-in for a remote signer. Signs like the real service:
    // the signing root is derived from the request.
    struct FakeSigner
    {
        struct Account
        {
            crypto::BlsSecretKey key;
            std::string passphrase;
            bool unlocked{false};
        };

        std::map<std::string, Account> accounts;
        bool unreachable{false};
        bool timeout{false};
        bool refuse_sign{false};
        bool refuse_lock{false};
        unsigned unlock_attempts{0};
        unsigned locks{0};
    };

    class FakeTransport final : public RemoteSignerTransport
    {
        std::shared_ptr<FakeSigner> signer_;

        Result<void> reachable() const
        {
            if (signer_->unreachable) {
                return KeyError::ConnectionError;
            }
            if (signer_->timeout) {
                return KeyError::RemoteSignerTimeout;
            }
            return outcome::success();
        }

    public:
        explicit FakeTransport(std::shared_ptr<FakeSigner> signer)
            : signer_{std::move(signer)}
        {
        }

        Result<std::vector<RemoteAccount>>
        list_accounts(std::string const &) override
        {
            BOOST_OUTCOME_TRY(reachable());
            std::vector<RemoteAccount> out;
            for (auto const &[name, account] : signer_->accounts) {
                out.push_back({name, account.key.public_key()});
            }
            return out;
        }

        Result<bool> unlock(
            std::string const &name, std::string const &passphrase) override
        {
            BOOST_OUTCOME_TRY(reachable());
            ++signer_->unlock_attempts;
            auto &account = signer_->accounts.at(name);
            account.unlocked = account.passphrase == passphrase;
            return account.unlocked;
        }

        Result<bool> lock(std::string const &name) override
        {
            BOOST_OUTCOME_TRY(reachable());
            if (signer_->refuse_lock) {
                return KeyError::RemoteSignerRejected;
            }
            ++signer_->locks;
            signer_->accounts.at(name).unlocked = false;
            return true;
        }

        Result<crypto::BlsSignatureBytes>
        sign(std::string const &name, crypto::SigningRequest const &r) override
        {
            BOOST_OUTCOME_TRY(reachable());
            auto const &account = signer_->accounts.at(name);
            if (signer_->refuse_sign || !account.unlocked) {
                return KeyError::RemoteSignerRejected;
            }
            auto const root = crypto::compute_signing_root(r);
            return account.key.sign(to_byte_string_view(root));
        }
    };

    struct Remote : public ::testing::Test
    {
        std::shared_ptr<FakeSigner> fake{std::make_shared<FakeSigner>()};

        Remote()
        {
            fake->accounts.emplace(
                "wallet/a", FakeSigner::Account{make_key(1), "alpha"});
            fake->accounts.emplace(
                "wallet/b", FakeSigner::Account{make_key(2), "beta"});
        }

        Result<RemoteSigner> connect(std::vector<std::string> passphrases)
        {
            return RemoteSigner::connect(
                std::make_unique<FakeTransport>(fake),
                "wallet",
                std::move(passphrases));
        }
    };
}

TEST(SecretKeys, public_keys_and_sign)
{
    auto keys = SecretKeys::from_hex({secret_hex(1), secret_hex(2).substr(2)});
    ASSERT_FALSE(keys.has_error());

    auto const pubkeys = keys.value().public_keys();
    ASSERT_EQ(pubkeys.size(), 2);
    EXPECT_EQ(pubkeys[0], make_key(1).public_key());
    EXPECT_EQ(pubkeys[1], make_key(2).public_key());

    auto const sig = keys.value().sign(pubkeys[1], request());
    ASSERT_FALSE(sig.has_error());
    EXPECT_TRUE(verifies(pubkeys[1], sig.value(), request()));
    EXPECT_FALSE(verifies(pubkeys[0], sig.value(), request()));

    auto const unknown = keys.value().sign(make_key(3).public_key(), request());
    ASSERT_TRUE(unknown.has_error());
    EXPECT_EQ(unknown.assume_error(), KeyError::UnknownKeyError);
}

TEST(SecretKeys, invalid)
{
    for (std::string const bad :
         {"0xzz",
          "0x00",
          "0x0000000000000000000000000000000000000000000000000000000000000000",
          "0xffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff"}) {
        auto const keys = SecretKeys::from_hex({bad});
        ASSERT_TRUE(keys.has_error()) << bad;
        EXPECT_EQ(keys.assume_error(), KeyError::InvalidSecretKey);
    }
}

TEST(KeySourceConfig, exactly_one_source)
{
    auto const none = validate(KeySourceConfig{});
    ASSERT_TRUE(none.has_error());
    EXPECT_EQ(none.assume_error(), ConfigError::MissingKeySource);

    KeySourceConfig two{.secret_keys = {secret_hex(1)}};
    two.remote_signer = RemoteSignerConfig{
        .url = "localhost:9091",
        .tls = {.client_cert = "client.crt", .client_key = "client.key"}};
    auto const ambiguous = validate(two);
    ASSERT_TRUE(ambiguous.has_error());
    EXPECT_EQ(ambiguous.assume_error(), ConfigError::AmbiguousKeySource);

    auto const res = make_key_source(two);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ConfigError::AmbiguousKeySource);

    EXPECT_FALSE(validate(KeySourceConfig{.secret_keys = {secret_hex(1)}})
                     .has_error());
}

TEST(KeySourceConfig, remote_signer_requires_tls)
{
    KeySourceConfig config;
    config.remote_signer = RemoteSignerConfig{
        .url = "localhost:9091", .tls = {.client_cert = "client.crt"}};
    auto const res = validate(config);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ConfigError::MissingTlsCredentials);
}

TEST(KeySourceConfig, keystore_requires_one_password_source)
{
    auto const dir = std::filesystem::temp_directory_path();

    KeySourceConfig config;
    config.keystore = KeystoreConfig{.path = dir};
    auto const none = validate(config);
    ASSERT_TRUE(none.has_error());
    EXPECT_EQ(none.assume_error(), ConfigError::MissingPasswordSource);

    config.keystore->password = "a";
    config.keystore->secrets_path = dir;
    auto const both = validate(config);
    ASSERT_TRUE(both.has_error());
    EXPECT_EQ(both.assume_error(), ConfigError::MissingPasswordSource);

    config.keystore->secrets_path.reset();
    EXPECT_FALSE(validate(config).has_error());

    config.keystore->path = dir / "bolt-does-not-exist";
    auto const missing = validate(config);
    ASSERT_TRUE(missing.has_error());
    EXPECT_EQ(missing.assume_error(), ConfigError::MalformedKeystoreDirectory);
}

TEST(KeySource, variant_dispatch)
{
    auto source =
        make_key_source(KeySourceConfig{.secret_keys = {secret_hex(5)}});
    ASSERT_FALSE(source.has_error());
    auto &key_source = source.value();
    EXPECT_TRUE(std::holds_alternative<SecretKeys>(key_source));

    auto const pubkeys = public_keys(key_source);
    ASSERT_EQ(pubkeys.size(), 1);
    auto const sig = sign(key_source, pubkeys[0], request());
    ASSERT_FALSE(sig.has_error());
    EXPECT_TRUE(verifies(pubkeys[0], sig.value(), request()));
}

TEST_F(Remote, lists_accounts)
{
    auto signer = connect({"alpha"});
    ASSERT_FALSE(signer.has_error());
    auto const pubkeys = signer.value().public_keys();
    ASSERT_EQ(pubkeys.size(), 2);
    EXPECT_EQ(pubkeys[0], make_key(1).public_key());
    EXPECT_EQ(pubkeys[1], make_key(2).public_key());
}

TEST_F(Remote, tries_each_passphrase_then_locks)
{
    auto signer = connect({"wrong", "beta", "alpha"});
    ASSERT_FALSE(signer.has_error());

    auto const pk = make_key(1).public_key();
    auto const sig = signer.value().sign(pk, request());
    ASSERT_FALSE(sig.has_error());
    EXPECT_TRUE(verifies(pk, sig.value(), request()));
    EXPECT_EQ(fake->unlock_attempts, 3);
    EXPECT_EQ(fake->locks, 1);
    EXPECT_FALSE(fake->accounts.at("wallet/a").unlocked);
}

TEST_F(Remote, no_passphrase_unlocks)
{
    auto signer = connect({"wrong"});
    ASSERT_FALSE(signer.has_error());
    auto const sig = signer.value().sign(make_key(2).public_key(), request());
    ASSERT_TRUE(sig.has_error());
    EXPECT_EQ(sig.assume_error(), KeyError::AccountLocked);
    EXPECT_FALSE(is_transport_error(sig.assume_error()));
}

TEST_F(Remote, unknown_key)
{
    auto signer = connect({"alpha"});
    ASSERT_FALSE(signer.has_error());
    auto const sig = signer.value().sign(make_key(9).public_key(), request());
    ASSERT_TRUE(sig.has_error());
    EXPECT_EQ(sig.assume_error(), KeyError::UnknownKeyError);
    EXPECT_EQ(fake->unlock_attempts, 0);
}

TEST_F(Remote, transport_errors_are_distinct_from_rejection)
{
    auto signer = connect({"alpha"});
    ASSERT_FALSE(signer.has_error());
    auto const pk = make_key(1).public_key();

    fake->unreachable = true;
    auto const down = signer.value().sign(pk, request());
    ASSERT_TRUE(down.has_error());
    EXPECT_EQ(down.assume_error(), KeyError::ConnectionError);
    EXPECT_TRUE(is_transport_error(down.assume_error()));

    fake->unreachable = false;
    fake->timeout = true;
    auto const slow = signer.value().sign(pk, request());
    ASSERT_TRUE(slow.has_error());
    EXPECT_EQ(slow.assume_error(), KeyError::RemoteSignerTimeout);
    EXPECT_TRUE(is_transport_error(slow.assume_error()));

    fake->timeout = false;
    fake->refuse_sign = true;
    auto const refused = signer.value().sign(pk, request());
    ASSERT_TRUE(refused.has_error());
    EXPECT_EQ(refused.assume_error(), KeyError::RemoteSignerRejected);
    EXPECT_FALSE(is_transport_error(refused.assume_error()));
}

TEST_F(Remote, lock_failure_is_not_fatal)
{
    auto signer = connect({"beta"});
    ASSERT_FALSE(signer.has_error());
    fake->refuse_lock = true;
    auto const pk = make_key(2).public_key();
    auto const sig = signer.value().sign(pk, request());
    ASSERT_FALSE(sig.has_error());
    EXPECT_TRUE(verifies(pk, sig.value(), request()));
}

TEST_F(Remote, connect_fails_when_unreachable)
{
    fake->unreachable = true;
    auto const signer = connect({"alpha"});
    ASSERT_TRUE(signer.has_error());
    EXPECT_EQ(signer.assume_error(), KeyError::ConnectionError);
}

TEST_F(Remote, as_key_source)
{
    auto signer = connect({"alpha", "beta"});
    ASSERT_FALSE(signer.has_error());
    KeySource source{std::move(signer).value()};
    auto const pubkeys = public_keys(source);
    ASSERT_EQ(pubkeys.size(), 2);
    for (auto const &pk : pubkeys) {
        auto const sig = sign(source, pk, request());
        ASSERT_FALSE(sig.has_error());
        EXPECT_TRUE(verifies(pk, sig.value(), request()));
    }
}
