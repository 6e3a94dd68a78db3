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
#include <bolt/crypto/chain.hpp>
#include <bolt/delegation/delegation_error.hpp>
#include <bolt/delegation/message.hpp>
#include <bolt/delegation/signer.hpp>
#include <bolt/delegation/test_fixtures.hpp>
#include <bolt/delegation/verifier.hpp>
#include <bolt/keys/key_source.hpp>

#include <gtest/gtest.h>

#include <utility>
#include <vector>

using namespace bolt;
using namespace bolt::crypto;
using namespace bolt::delegation;

namespace
{
    keys::KeySource make_source()
    {
        std::vector<BlsSecretKey> keys;
        keys.push_back(test::make_key(1));
        keys.push_back(test::make_key(2));
        keys.push_back(test::make_key(3));
        return keys::KeySource{keys::SecretKeys{std::move(keys)}};
    }
}

TEST(Signer, one_message_per_key)
{
    auto source = make_source();
    auto const delegatee = test::make_key(50).public_key();

    auto const res =
        sign_delegations(source, delegatee, Action::Delegate, Chain::Helder);
    ASSERT_TRUE(res.has_value());
    auto const &messages = res.value();
    auto const pubkeys = keys::public_keys(source);
    ASSERT_EQ(messages.size(), pubkeys.size());

    DelegationVerifier const verifier{Chain::Helder};
    for (size_t i = 0; i < messages.size(); ++i) {
        EXPECT_EQ(messages[i].validator_pubkey, pubkeys[i]);
        EXPECT_EQ(messages[i].delegatee_pubkey, delegatee);
        EXPECT_EQ(messages[i].action, Action::Delegate);
        EXPECT_EQ(messages[i].chain_id, chain_id(Chain::Helder));
        EXPECT_TRUE(verifier.verify(messages[i]).has_value());
    }

    // same signature as signing the tuple directly
    EXPECT_EQ(
        messages[0],
        test::make_message(
            test::make_key(1), delegatee, Action::Delegate, Chain::Helder));
}

TEST(Signer, revocations)
{
    auto source = make_source();
    auto const delegatee = test::make_key(50).public_key();
    auto const res =
        sign_delegations(source, delegatee, Action::Revoke, Chain::Mainnet);
    ASSERT_TRUE(res.has_value());
    for (auto const &message : res.value()) {
        EXPECT_EQ(message.action, Action::Revoke);
        EXPECT_TRUE(
            DelegationVerifier{Chain::Mainnet}.verify(message).has_value());
        EXPECT_EQ(
            DelegationVerifier{Chain::Holesky}.verify(message).error(),
            DelegationError::WrongChain);
    }
}

TEST(Signer, invalid_delegatee)
{
    auto source = make_source();
    BlsPubkeyBytes delegatee{};
    auto const res =
        sign_delegations(source, delegatee, Action::Delegate, Chain::Mainnet);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), DelegationError::MalformedPoint);
}
