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
#include <bolt/core/config_error.hpp>
#include <bolt/core/hex.hpp>
#include <bolt/crypto/chain.hpp>
#include <bolt/crypto/signing.hpp>

#include <gtest/gtest.h>

using namespace bolt;
using namespace bolt::crypto;
using namespace bolt::literals;

TEST(Chain, presets)
{
    EXPECT_EQ(chain_id(Chain::Mainnet), 1);
    EXPECT_EQ(chain_id(Chain::Holesky), 17000);
    EXPECT_EQ(chain_id(Chain::Helder), 7014190335);
    EXPECT_EQ(chain_id(Chain::Kurtosis), 3151908);

    EXPECT_EQ(fork_version(Chain::Holesky), (ForkVersion{0x01, 0x01, 0x70, 0x00}));
    EXPECT_EQ(fork_version(Chain::Kurtosis), (ForkVersion{0x10, 0x00, 0x00, 0x38}));

    EXPECT_EQ(chain_from_id(17000), Chain::Holesky);
    EXPECT_FALSE(chain_from_id(5).has_value());
}

TEST(Chain, parse)
{
    EXPECT_EQ(parse_chain("holesky").value(), Chain::Holesky);
    EXPECT_EQ(parse_chain("Mainnet").value(), Chain::Mainnet);
    EXPECT_EQ(parse_chain("KURTOSIS").value(), Chain::Kurtosis);

    auto const res = parse_chain("sepolia");
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ConfigError::UnknownChain);
}

TEST(Signing, fork_data_root)
{
    EXPECT_EQ(
        compute_fork_data_root(fork_version(Chain::Mainnet)),
        0xf5a5fd42d16a20302798ef6ed309979b43003d2320d9f0e8ea9831a92759fb4b_bytes32);
    EXPECT_EQ(
        compute_fork_data_root(fork_version(Chain::Holesky)),
        0x5b83a23759c560b2d0c64576e1dcfc34ea94c4988f3e0d9f77f053875f3509ee_bytes32);
}

TEST(Signing, domains)
{
    EXPECT_EQ(
        compute_domain(DOMAIN_COMMITMENT, Chain::Mainnet),
        0x6d6d6f43f5a5fd42d16a20302798ef6ed309979b43003d2320d9f0e8ea9831a9_bytes32);
    EXPECT_EQ(
        compute_domain(DOMAIN_DELEGATION, Chain::Holesky),
        0x626f6c015b83a23759c560b2d0c64576e1dcfc34ea94c4988f3e0d9f77f05387_bytes32);
    EXPECT_EQ(
        compute_domain(DOMAIN_REGISTRATION, Chain::Holesky),
        0x626f6c025b83a23759c560b2d0c64576e1dcfc34ea94c4988f3e0d9f77f05387_bytes32);

    // same purpose, different chain
    EXPECT_NE(
        compute_domain(DOMAIN_DELEGATION, Chain::Holesky),
        compute_domain(DOMAIN_DELEGATION, Chain::Mainnet));
}

TEST(Signing, signing_root)
{
    bytes32_t root;
    bytes32_t domain;
    std::fill_n(root.bytes, 32, 0x11);
    std::fill_n(domain.bytes, 32, 0x22);
    EXPECT_EQ(
        compute_signing_root(root, domain),
        0x5189c77d29fe5d546a045ec46986852785fea5c13ac7da9c115ff5fb6edf817c_bytes32);
    EXPECT_EQ(
        compute_signing_root(SigningRequest{root, domain}),
        compute_signing_root(root, domain));
}

TEST(Signing, sha256)
{
    EXPECT_EQ(
        sha256(to_byte_string_view(std::string{"abc"})),
        0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad_bytes32);
}
