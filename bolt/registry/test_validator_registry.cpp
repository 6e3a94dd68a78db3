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

#include <bolt/core/address.hpp>
#include <bolt/core/bytes.hpp>
#include <bolt/crypto/bls.hpp>
#include <bolt/crypto/chain.hpp>
#include <bolt/crypto/signing.hpp>
#include <bolt/registry/contract/abi_encode.hpp>
#include <bolt/registry/contract/contract_state.hpp>
#include <bolt/registry/registry_error.hpp>
#include <bolt/registry/registry_parameters.hpp>
#include <bolt/registry/validator_registry.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <vector>

using namespace bolt;
using namespace bolt::crypto;
using namespace bolt::registry;

namespace
{
    constexpr auto ADMIN{0x00000000000000000000000000000000000000ad_address};
    constexpr auto ALICE{0x00000000000000000000000000000000000a11ce_address};
    constexpr auto BOB{0x0000000000000000000000000000000000000b0b_address};
    constexpr auto OPERATOR_A{
        0x000000000000000000000000000000000000a0a0_address};
    constexpr auto OPERATOR_B{
        0x000000000000000000000000000000000000b0b0_address};

    BlsSecretKey make_key(uint8_t const seed)
    {
        return BlsSecretKey::from_ikm(byte_string(32, seed)).value();
    }

    struct RegistryTest : public ::testing::Test
    {
        ContractState state;
        RegistryParameters params{ADMIN};
        ValidatorRegistry registry{state, params, Chain::Holesky};

        BlsSecretKey k1 = make_key(1);
        BlsSecretKey k2 = make_key(2);
        BlsSecretKey k3 = make_key(3);

        BlsSignatureBytes proof(BlsSecretKey const &sk, Address const &caller)
        {
            auto const root = registration_signing_root(
                sk.public_key(), caller, Chain::Holesky);
            return sk.sign(to_byte_string_view(root));
        }

        void enable_unsafe()
        {
            ASSERT_TRUE(params.set_allow_unsafe_registration(ADMIN, true));
        }

        Result<void> register_with_proof(
            BlsSecretKey const &sk, Address const &caller,
            Address const &op = OPERATOR_A)
        {
            return registry.register_validator(
                caller, sk.public_key(), proof(sk, caller), 30'000'000, op);
        }
    };
}

TEST_F(RegistryTest, unsafe_end_to_end)
{
    enable_unsafe();
    auto const pubkey = k1.public_key();
    ASSERT_TRUE(registry.register_validator_unsafe(
        ALICE, pubkey, 1'000'000, OPERATOR_A));

    auto const validator = registry.get_validator_by_pubkey(pubkey);
    EXPECT_TRUE(validator.exists);
    EXPECT_EQ(validator.pubkey, pubkey);
    EXPECT_EQ(validator.max_committed_gas_limit, 1'000'000);
    EXPECT_EQ(validator.authorized_operator, OPERATOR_A);
    EXPECT_EQ(validator.controller, ALICE);
    EXPECT_EQ(validator.sequence_number, 1);

    auto const again = registry.register_validator_unsafe(
        ALICE, pubkey, 1'000'000, OPERATOR_A);
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.error(), RegistryError::ValidatorAlreadyExists);
}

TEST_F(RegistryTest, unsafe_disabled_rejects_everything)
{
    EXPECT_FALSE(params.allow_unsafe_registration());

    BlsPubkeyBytes malformed{};
    for (auto const &pubkey : {k1.public_key(), k2.public_key(), malformed}) {
        for (auto const &op : {OPERATOR_A, Address{}}) {
            auto const res =
                registry.register_validator_unsafe(ALICE, pubkey, 1, op);
            ASSERT_TRUE(res.has_error());
            EXPECT_EQ(res.error(), RegistryError::UnsafeRegistrationNotAllowed);
        }
    }
    EXPECT_FALSE(registry.get_validator_by_pubkey(k1.public_key()).exists);
    EXPECT_EQ(state.storage_size(REGISTRY_CA), 0);
    EXPECT_TRUE(state.logs().empty());
}

TEST_F(RegistryTest, disabling_unsafe_registration)
{
    enable_unsafe();
    ASSERT_TRUE(registry.register_validator_unsafe(
        ALICE, k1.public_key(), 1'000'000, OPERATOR_A));

    ASSERT_TRUE(params.set_allow_unsafe_registration(ADMIN, false));
    auto const res = registry.register_validator_unsafe(
        ALICE, k2.public_key(), 1'000'000, OPERATOR_A);
    EXPECT_EQ(res.error(), RegistryError::UnsafeRegistrationNotAllowed);
    EXPECT_FALSE(registry.get_validator_by_pubkey(k2.public_key()).exists);
}

TEST_F(RegistryTest, only_admin_sets_flag)
{
    auto const res = params.set_allow_unsafe_registration(ALICE, true);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), RegistryError::UnauthorizedCaller);
    EXPECT_FALSE(params.allow_unsafe_registration());
}

TEST_F(RegistryTest, unsafe_zero_operator)
{
    enable_unsafe();
    for (auto const *sk : {&k1, &k2, &k3}) {
        auto const res = registry.register_validator_unsafe(
            ALICE, sk->public_key(), 1'000'000, Address{});
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), RegistryError::InvalidAuthorizedOperator);
    }
}

TEST_F(RegistryTest, unsafe_malformed_pubkey)
{
    enable_unsafe();
    BlsPubkeyBytes infinity{};
    infinity[0] = 0xc0;
    EXPECT_EQ(
        registry.register_validator_unsafe(ALICE, infinity, 1, OPERATOR_A)
            .error(),
        RegistryError::MalformedPoint);
}

TEST_F(RegistryTest, register_with_proof_of_possession)
{
    ASSERT_TRUE(register_with_proof(k1, ALICE));
    auto const validator = registry.get_validator_by_pubkey(k1.public_key());
    EXPECT_TRUE(validator.exists);
    EXPECT_EQ(validator.controller, ALICE);
    EXPECT_EQ(validator.max_committed_gas_limit, 30'000'000);
}

TEST_F(RegistryTest, proof_binds_controller_and_key)
{
    // proof made for another controller
    auto res = registry.register_validator(
        BOB, k1.public_key(), proof(k1, ALICE), 1, OPERATOR_A);
    EXPECT_EQ(res.error(), RegistryError::BadSignature);

    // proof made by another key
    res = registry.register_validator(
        ALICE, k1.public_key(), proof(k2, ALICE), 1, OPERATOR_A);
    EXPECT_EQ(res.error(), RegistryError::BadSignature);

    // proof made on another chain
    auto const mainnet_root =
        registration_signing_root(k1.public_key(), ALICE, Chain::Mainnet);
    res = registry.register_validator(
        ALICE,
        k1.public_key(),
        k1.sign(to_byte_string_view(mainnet_root)),
        1,
        OPERATOR_A);
    EXPECT_EQ(res.error(), RegistryError::BadSignature);

    // a delegation-domain signature over the same object is not a proof
    byte_string message;
    message += to_byte_string_view(k1.public_key());
    message += to_byte_string_view(ALICE.bytes);
    auto const delegation_root = compute_signing_root(
        sha256(message), compute_domain(DOMAIN_DELEGATION, Chain::Holesky));
    res = registry.register_validator(
        ALICE,
        k1.public_key(),
        k1.sign(to_byte_string_view(delegation_root)),
        1,
        OPERATOR_A);
    EXPECT_EQ(res.error(), RegistryError::BadSignature);

    EXPECT_FALSE(registry.get_validator_by_pubkey(k1.public_key()).exists);
}

TEST_F(RegistryTest, register_error_order)
{
    BlsSignatureBytes bad_sig{};
    bad_sig[0] = 0xc0;

    // malformed points come first
    EXPECT_EQ(
        registry
            .register_validator(ALICE, k1.public_key(), bad_sig, 1, Address{})
            .error(),
        RegistryError::MalformedPoint);

    // then the operator
    EXPECT_EQ(
        registry
            .register_validator(
                ALICE, k1.public_key(), proof(k2, ALICE), 1, Address{})
            .error(),
        RegistryError::InvalidAuthorizedOperator);

    // then existence, before the proof is looked at
    ASSERT_TRUE(register_with_proof(k1, ALICE));
    EXPECT_EQ(
        registry
            .register_validator(
                ALICE, k1.public_key(), proof(k2, ALICE), 1, OPERATOR_A)
            .error(),
        RegistryError::ValidatorAlreadyExists);
}

TEST_F(RegistryTest, uniqueness_under_interleaving)
{
    enable_unsafe();
    ASSERT_TRUE(register_with_proof(k2, BOB));
    ASSERT_TRUE(registry.register_validator_unsafe(
        ALICE, k1.public_key(), 1, OPERATOR_A));
    ASSERT_TRUE(register_with_proof(k3, ALICE));

    EXPECT_EQ(
        register_with_proof(k1, BOB).error(),
        RegistryError::ValidatorAlreadyExists);
    EXPECT_EQ(
        registry.register_validator_unsafe(BOB, k2.public_key(), 1, OPERATOR_B)
            .error(),
        RegistryError::ValidatorAlreadyExists);
    EXPECT_EQ(registry.validator_count(), 3);

    // the first registration is untouched
    auto const validator = registry.get_validator_by_pubkey(k1.public_key());
    EXPECT_EQ(validator.controller, ALICE);
    EXPECT_EQ(validator.sequence_number, 2);
}

TEST_F(RegistryTest, deregister)
{
    ASSERT_TRUE(register_with_proof(k1, ALICE));

    EXPECT_EQ(
        registry.deregister_validator(ALICE, k2.public_key()).error(),
        RegistryError::NotRegisteredValidator);
    EXPECT_EQ(
        registry.deregister_validator(BOB, k1.public_key()).error(),
        RegistryError::UnauthorizedCaller);
    EXPECT_TRUE(registry.get_validator_by_pubkey(k1.public_key()).exists);

    ASSERT_TRUE(registry.deregister_validator(ALICE, k1.public_key()));
    auto const validator = registry.get_validator_by_pubkey(k1.public_key());
    EXPECT_FALSE(validator.exists);
    EXPECT_EQ(validator.controller, Address{});

    EXPECT_EQ(
        registry.deregister_validator(ALICE, k1.public_key()).error(),
        RegistryError::NotRegisteredValidator);
}

TEST_F(RegistryTest, tombstone_blocks_reregistration)
{
    enable_unsafe();
    ASSERT_TRUE(register_with_proof(k1, ALICE));
    ASSERT_TRUE(registry.deregister_validator(ALICE, k1.public_key()));

    EXPECT_EQ(
        register_with_proof(k1, ALICE).error(),
        RegistryError::ValidatorAlreadyExists);
    EXPECT_EQ(
        registry.register_validator_unsafe(BOB, k1.public_key(), 1, OPERATOR_B)
            .error(),
        RegistryError::ValidatorAlreadyExists);
    EXPECT_FALSE(registry.get_validator_by_pubkey(k1.public_key()).exists);
}

TEST_F(RegistryTest, updates_by_controller_only)
{
    ASSERT_TRUE(register_with_proof(k1, ALICE));
    auto const pubkey = k1.public_key();

    EXPECT_EQ(
        registry.update_max_committed_gas_limit(BOB, pubkey, 5).error(),
        RegistryError::UnauthorizedCaller);
    EXPECT_EQ(
        registry.update_authorized_operator(BOB, pubkey, OPERATOR_B).error(),
        RegistryError::UnauthorizedCaller);
    EXPECT_EQ(
        registry.update_authorized_operator(ALICE, pubkey, Address{}).error(),
        RegistryError::InvalidAuthorizedOperator);
    EXPECT_EQ(
        registry.update_max_committed_gas_limit(ALICE, k2.public_key(), 5)
            .error(),
        RegistryError::NotRegisteredValidator);

    ASSERT_TRUE(registry.update_max_committed_gas_limit(ALICE, pubkey, 5));
    ASSERT_TRUE(registry.update_authorized_operator(ALICE, pubkey, OPERATOR_B));

    auto const validator = registry.get_validator_by_pubkey(pubkey);
    EXPECT_EQ(validator.max_committed_gas_limit, 5);
    EXPECT_EQ(validator.authorized_operator, OPERATOR_B);
    EXPECT_EQ(validator.controller, ALICE);
    EXPECT_EQ(validator.sequence_number, 1);
}

TEST_F(RegistryTest, failed_calls_leave_storage_untouched)
{
    enable_unsafe();
    ASSERT_TRUE(register_with_proof(k1, ALICE));
    auto const before = registry.get_validator_by_pubkey(k1.public_key());
    auto const slots = state.storage_size(REGISTRY_CA);
    auto const logs = state.logs().size();

    EXPECT_FALSE(register_with_proof(k1, BOB));
    EXPECT_FALSE(registry.register_validator_unsafe(
        BOB, k2.public_key(), 1, Address{}));
    EXPECT_FALSE(registry.deregister_validator(BOB, k1.public_key()));
    EXPECT_FALSE(
        registry.update_authorized_operator(ALICE, k1.public_key(), Address{}));
    EXPECT_FALSE(registry.update_max_committed_gas_limit(BOB, k1.public_key(), 1));

    EXPECT_EQ(registry.get_validator_by_pubkey(k1.public_key()), before);
    EXPECT_FALSE(registry.get_validator_by_pubkey(k2.public_key()).exists);
    EXPECT_EQ(state.storage_size(REGISTRY_CA), slots);
    EXPECT_EQ(state.logs().size(), logs);
    EXPECT_EQ(registry.validator_count(), 1);
}

TEST_F(RegistryTest, events)
{
    ASSERT_TRUE(register_with_proof(k1, ALICE));
    ASSERT_TRUE(registry.update_max_committed_gas_limit(
        ALICE, k1.public_key(), 42));
    ASSERT_TRUE(registry.update_authorized_operator(
        ALICE, k1.public_key(), OPERATOR_B));
    ASSERT_TRUE(registry.deregister_validator(ALICE, k1.public_key()));

    auto const &logs = state.logs();
    ASSERT_EQ(logs.size(), 4);

    auto const hash = pubkey_hash(BlsPubkey{k1.public_key()}.serialize());
    bytes32_t hash_topic{};
    std::copy_n(hash.bytes, 20, hash_topic.bytes);

    EXPECT_EQ(
        logs[0].topics[0],
        0x2130de3c82365fdc1551330dc378493223f80a47c94702d7703682e225779e23_bytes32);
    ASSERT_EQ(logs[0].topics.size(), 3);
    EXPECT_EQ(logs[0].topics[1], hash_topic);
    EXPECT_EQ(logs[0].topics[2], abi_encode_address(ALICE));
    EXPECT_EQ(logs[0].data.size(), 64);
    EXPECT_EQ(logs[0].address, REGISTRY_CA);

    EXPECT_EQ(
        logs[1].topics[0],
        0x6032ca7d4352918d6cc164d9f436dfbfa8562ead5f775613780d42283c031b84_bytes32);
    EXPECT_EQ(
        logs[1].data,
        byte_string{to_byte_string_view(abi_encode_uint(u64_be{42}))});

    EXPECT_EQ(
        logs[2].topics[0],
        0x8a63240517af64320aba45279e0eb14dadd814e6b88c00e0e2fc3f63350f80d1_bytes32);
    EXPECT_EQ(
        logs[2].data,
        byte_string{to_byte_string_view(abi_encode_address(OPERATOR_B))});

    EXPECT_EQ(
        logs[3].topics[0],
        0x6cecb8c8096fc1a7109a0f24de87daf3e9597dfb804401d29dab9a61a7bb898f_bytes32);
    ASSERT_EQ(logs[3].topics.size(), 3);
    EXPECT_EQ(logs[3].topics[2], abi_encode_address(ALICE));
    EXPECT_TRUE(logs[3].data.empty());
}

TEST_F(RegistryTest, batch_queries)
{
    enable_unsafe();
    std::vector<BlsSecretKey> keys;
    for (uint8_t i = 0; i < 7; ++i) {
        keys.push_back(make_key(static_cast<uint8_t>(20 + i)));
        ASSERT_TRUE(registry.register_validator_unsafe(
            ALICE, keys.back().public_key(), i, OPERATOR_A));
    }
    ASSERT_TRUE(registry.deregister_validator(ALICE, keys[2].public_key()));

    auto const batch = registry.get_validators_by_pubkeys(
        {keys[0].public_key(), keys[2].public_key(), k1.public_key()});
    ASSERT_EQ(batch.size(), 3);
    EXPECT_TRUE(batch[0].exists);
    EXPECT_FALSE(batch[1].exists);
    EXPECT_FALSE(batch[2].exists);
    EXPECT_EQ(batch[2].pubkey, k1.public_key());

    auto [done, next, page] = registry.get_all_validators(0, 3);
    EXPECT_FALSE(done);
    EXPECT_EQ(next, 3);
    ASSERT_EQ(page.size(), 2); // the tombstone is skipped
    EXPECT_EQ(page[0].pubkey, keys[0].public_key());
    EXPECT_EQ(page[1].pubkey, keys[1].public_key());

    std::tie(done, next, page) = registry.get_all_validators(next, 3);
    EXPECT_FALSE(done);
    EXPECT_EQ(next, 6);
    ASSERT_EQ(page.size(), 3);
    EXPECT_EQ(page[2].sequence_number, 6);

    std::tie(done, next, page) = registry.get_all_validators(next, 3);
    EXPECT_TRUE(done);
    EXPECT_EQ(next, 7);
    ASSERT_EQ(page.size(), 1);
    EXPECT_EQ(page[0].max_committed_gas_limit, 6);

    std::tie(done, next, page) = registry.get_all_validators(100, 3);
    EXPECT_TRUE(done);
    EXPECT_TRUE(page.empty());
}

TEST_F(RegistryTest, zero_limit_reads_default_page)
{
    enable_unsafe();
    constexpr uint64_t count = PAGINATED_RESULTS_SIZE + 5;
    for (uint64_t i = 0; i < count; ++i) {
        byte_string ikm(32, 0x33);
        ikm[0] = static_cast<uint8_t>(i);
        auto const sk = BlsSecretKey::from_ikm(ikm).value();
        ASSERT_TRUE(registry.register_validator_unsafe(
            ALICE, sk.public_key(), 1, OPERATOR_A));
    }

    auto [done, next, page] = registry.get_all_validators(0, 0);
    EXPECT_FALSE(done);
    EXPECT_EQ(next, PAGINATED_RESULTS_SIZE);
    EXPECT_EQ(page.size(), PAGINATED_RESULTS_SIZE);

    std::tie(done, next, page) = registry.get_all_validators(next, 0);
    EXPECT_TRUE(done);
    EXPECT_EQ(next, count);
    EXPECT_EQ(page.size(), 5);
}
