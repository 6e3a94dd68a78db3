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

#include <bolt/core/fiber/priority_pool.hpp>
#include <bolt/crypto/bls.hpp>
#include <bolt/crypto/chain.hpp>
#include <bolt/delegation/artifact.hpp>
#include <bolt/delegation/delegation_error.hpp>
#include <bolt/delegation/delegation_store.hpp>
#include <bolt/delegation/message.hpp>
#include <bolt/delegation/test_fixtures.hpp>
#include <bolt/delegation/verifier.hpp>

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <vector>

using namespace bolt;
using namespace bolt::crypto;
using namespace bolt::delegation;

namespace
{
    struct DelegationStoreTest : public ::testing::Test
    {
        fiber::PriorityPool pool{2, 4};
        DelegationVerifier verifier{Chain::Holesky};

        BlsSecretKey alice = test::make_key(1);
        BlsSecretKey bob = test::make_key(2);
        BlsPubkeyBytes d1 = test::make_key(10).public_key();
        BlsPubkeyBytes d2 = test::make_key(11).public_key();

        DelegationMessage
        msg(BlsSecretKey const &validator, BlsPubkeyBytes const &delegatee,
            Action const action)
        {
            return test::make_message(
                validator, delegatee, action, Chain::Holesky);
        }

        DelegationStore load(std::vector<DelegationMessage> const &messages)
        {
            std::vector<Result<DelegationMessage>> records;
            for (auto const &message : messages) {
                records.push_back(message);
            }
            return DelegationStore::load(std::move(records), verifier, pool);
        }
    };
}

TEST_F(DelegationStoreTest, empty)
{
    auto const store = load({});
    EXPECT_TRUE(store.delegations().empty());
    EXPECT_FALSE(store.resolve_signer(alice.public_key()).has_value());
    EXPECT_EQ(store.report().accepted, 0);
}

TEST_F(DelegationStoreTest, delegate)
{
    auto const store = load(
        {msg(alice, d1, Action::Delegate), msg(bob, d2, Action::Delegate)});
    EXPECT_EQ(store.resolve_signer(alice.public_key()), d1);
    EXPECT_EQ(store.resolve_signer(bob.public_key()), d2);
    EXPECT_FALSE(store.resolve_signer(d1).has_value());
    EXPECT_EQ(store.report().accepted, 2);
    EXPECT_TRUE(store.report().dropped.empty());
    EXPECT_TRUE(store.report().ignored.empty());
}

TEST_F(DelegationStoreTest, one_valid_one_malformed)
{
    auto records = nlohmann::json::array();
    records.push_back(to_json(msg(alice, d1, Action::Delegate)));
    records.push_back({{"message", "garbage"}});
    auto parsed = parse_artifact(records.dump());
    ASSERT_TRUE(parsed.has_value());

    auto const store =
        DelegationStore::load(std::move(parsed).value(), verifier, pool);
    EXPECT_EQ(store.delegations().size(), 1);
    EXPECT_EQ(store.resolve_signer(alice.public_key()), d1);
    ASSERT_EQ(store.report().dropped.size(), 1);
    EXPECT_EQ(store.report().dropped[0].index, 1);
    EXPECT_EQ(
        store.report().dropped[0].error, DelegationError::MalformedRecord);
}

TEST_F(DelegationStoreTest, invalid_messages_dropped)
{
    auto forged = msg(bob, d2, Action::Delegate);
    forged.delegatee_pubkey = d1;
    auto const wrong_chain =
        test::make_message(alice, d2, Action::Delegate, Chain::Mainnet);
    auto malformed = msg(bob, d1, Action::Delegate);
    malformed.signature = {};

    auto const store = load(
        {msg(alice, d1, Action::Delegate), forged, wrong_chain, malformed});
    EXPECT_EQ(store.resolve_signer(alice.public_key()), d1);
    EXPECT_FALSE(store.resolve_signer(bob.public_key()).has_value());

    auto const &dropped = store.report().dropped;
    ASSERT_EQ(dropped.size(), 3);
    EXPECT_EQ(dropped[0].index, 1);
    EXPECT_EQ(dropped[0].error, DelegationError::BadSignature);
    EXPECT_EQ(dropped[1].index, 2);
    EXPECT_EQ(dropped[1].error, DelegationError::WrongChain);
    EXPECT_EQ(dropped[2].index, 3);
    EXPECT_EQ(dropped[2].error, DelegationError::MalformedPoint);
}

TEST_F(DelegationStoreTest, last_delegate_wins)
{
    auto const store = load(
        {msg(alice, d1, Action::Delegate), msg(alice, d2, Action::Delegate)});
    EXPECT_EQ(store.resolve_signer(alice.public_key()), d2);
    EXPECT_EQ(store.delegations().size(), 1);
}

TEST_F(DelegationStoreTest, revoke_after_delegate)
{
    auto const store = load(
        {msg(alice, d1, Action::Delegate), msg(alice, d1, Action::Revoke)});
    EXPECT_FALSE(store.resolve_signer(alice.public_key()).has_value());
    EXPECT_EQ(store.report().accepted, 2);
}

TEST_F(DelegationStoreTest, delegate_after_revoke)
{
    auto const store = load(
        {msg(alice, d1, Action::Delegate),
         msg(alice, d1, Action::Revoke),
         msg(alice, d1, Action::Delegate)});
    EXPECT_EQ(store.resolve_signer(alice.public_key()), d1);
}

TEST_F(DelegationStoreTest, revoke_before_delegate_is_ignored)
{
    auto const store = load(
        {msg(alice, d1, Action::Revoke), msg(alice, d1, Action::Delegate)});
    EXPECT_EQ(store.resolve_signer(alice.public_key()), d1);
    ASSERT_EQ(store.report().ignored.size(), 1);
    EXPECT_EQ(store.report().ignored[0], 0);
}

TEST_F(DelegationStoreTest, revoke_of_replaced_delegatee_is_ignored)
{
    auto const store = load(
        {msg(alice, d1, Action::Delegate),
         msg(alice, d2, Action::Delegate),
         msg(alice, d1, Action::Revoke)});
    EXPECT_EQ(store.resolve_signer(alice.public_key()), d2);
    ASSERT_EQ(store.report().ignored.size(), 1);
    EXPECT_EQ(store.report().ignored[0], 2);
    EXPECT_EQ(store.report().accepted, 2);
}

TEST_F(DelegationStoreTest, many_records)
{
    std::vector<DelegationMessage> messages;
    std::vector<BlsSecretKey> validators;
    for (uint8_t i = 0; i < 64; ++i) {
        validators.push_back(test::make_key(static_cast<uint8_t>(100 + i)));
    }
    for (auto const &validator : validators) {
        messages.push_back(msg(validator, d1, Action::Delegate));
    }
    for (size_t i = 0; i < validators.size(); i += 2) {
        messages.push_back(msg(validators[i], d1, Action::Revoke));
    }

    auto const store = load(messages);
    EXPECT_EQ(store.delegations().size(), validators.size() / 2);
    for (size_t i = 0; i < validators.size(); ++i) {
        auto const signer = store.resolve_signer(validators[i].public_key());
        if (i % 2 == 0) {
            EXPECT_FALSE(signer.has_value());
        }
        else {
            EXPECT_EQ(signer, d1);
        }
    }
}
