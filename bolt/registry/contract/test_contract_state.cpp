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
#include <bolt/core/big_endian.hpp>
#include <bolt/core/bytes.hpp>
#include <bolt/registry/contract/abi_encode.hpp>
#include <bolt/registry/contract/contract_state.hpp>
#include <bolt/registry/contract/events.hpp>
#include <bolt/registry/contract/storage_array.hpp>
#include <bolt/registry/contract/storage_variable.hpp>

#include <gtest/gtest.h>

#include <intx/intx.hpp>

using namespace bolt;
using namespace bolt::registry;
using namespace intx::literals;

struct Storage : public ::testing::Test
{
    static constexpr auto ADDRESS{
        0x36928500bc1dcd7af6a2b4008875cc336b927d57_address};
    ContractState state;
};

TEST_F(Storage, variable)
{
    StorageVariable<u256_be> var(state, ADDRESS, bytes32_t{6000});
    ASSERT_FALSE(var.load_checked().has_value());
    var.store(5_u256);
    ASSERT_TRUE(var.load_checked().has_value());
    EXPECT_EQ(var.load().native(), 5_u256);
    var.store(2000_u256);
    EXPECT_EQ(var.load().native(), 2000_u256);
    // zero slots are dropped, not stored
    var.store(0_u256);
    EXPECT_FALSE(var.load_checked().has_value());
    EXPECT_EQ(state.storage_size(ADDRESS), 0);
}

TEST_F(Storage, multi_slot_struct)
{
    struct S
    {
        u64_be x;
        Address a;
        u256_be z;
    };

    static_assert(StorageVariable<S>::N == 2);

    StorageVariable<S> var(state, ADDRESS, bytes32_t{6000});
    ASSERT_FALSE(var.load_checked().has_value());
    var.store(S{.x = 4, .a = Address{0xdeadbeef}, .z = 6_u256});
    EXPECT_EQ(state.storage_size(ADDRESS), 2);

    S s = var.load();
    EXPECT_EQ(s.x.native(), 4);
    EXPECT_EQ(s.a, Address{0xdeadbeef});
    EXPECT_EQ(s.z.native(), 6_u256);

    // the neighbouring slot belongs to the struct
    StorageVariable<u256_be> next(state, ADDRESS, bytes32_t{6001});
    EXPECT_TRUE(next.load_checked().has_value());
    StorageVariable<u256_be> after(state, ADDRESS, bytes32_t{6002});
    EXPECT_FALSE(after.load_checked().has_value());
}

TEST_F(Storage, addresses_are_isolated)
{
    constexpr auto OTHER{0x00000000000000000000000000000000000000ff_address};
    StorageVariable<u64_be> var(state, ADDRESS, bytes32_t{1});
    StorageVariable<u64_be> other(state, OTHER, bytes32_t{1});
    var.store(7);
    EXPECT_EQ(var.load().native(), 7);
    EXPECT_FALSE(other.load_checked().has_value());
}

TEST_F(Storage, array)
{
    StorageArray<Address> array(state, ADDRESS, bytes32_t{100});
    EXPECT_EQ(array.length(), 0);
    array.push(Address{1});
    array.push(Address{2});
    array.push(Address{3});
    EXPECT_EQ(array.length(), 3);
    EXPECT_EQ(array.get(0).load(), Address{1});
    EXPECT_EQ(array.get(2).load(), Address{3});
    EXPECT_FALSE(array.get(3).load_checked().has_value());
}

TEST_F(Storage, checkpoint_accept)
{
    StorageVariable<u64_be> var(state, ADDRESS, bytes32_t{1});
    var.store(1);

    state.push();
    var.store(2);
    state.push();
    var.store(3);
    state.pop_accept();
    EXPECT_EQ(var.load().native(), 3);
    state.pop_accept();
    EXPECT_EQ(var.load().native(), 3);
    EXPECT_EQ(state.version(), 0);
}

TEST_F(Storage, checkpoint_reject)
{
    StorageVariable<u64_be> var(state, ADDRESS, bytes32_t{1});
    var.store(1);

    state.push();
    var.store(2);
    state.push();
    var.store(3);
    state.pop_reject();
    EXPECT_EQ(var.load().native(), 2);
    state.pop_reject();
    EXPECT_EQ(var.load().native(), 1);
}

TEST_F(Storage, accepted_write_rolls_back_with_outer_checkpoint)
{
    StorageVariable<u64_be> var(state, ADDRESS, bytes32_t{1});
    var.store(1);

    // first write two levels up, accepted into a level that never wrote
    state.push();
    state.push();
    var.store(3);
    state.pop_accept();
    EXPECT_EQ(var.load().native(), 3);
    state.pop_reject();
    EXPECT_EQ(var.load().native(), 1);
    EXPECT_EQ(state.version(), 0);
}

TEST_F(Storage, reject_first_write)
{
    state.push();
    StorageArray<u64_be> array(state, ADDRESS, bytes32_t{5});
    array.push(9);
    state.store_log(EventBuilder(ADDRESS, bytes32_t{1}).build());
    EXPECT_EQ(state.logs().size(), 1);
    state.pop_reject();

    EXPECT_EQ(state.storage_size(ADDRESS), 0);
    EXPECT_EQ(array.length(), 0);
    EXPECT_TRUE(state.logs().empty());
}

TEST_F(Storage, logs_follow_checkpoints)
{
    state.push();
    state.store_log(EventBuilder(ADDRESS, bytes32_t{1}).build());
    state.pop_accept();

    state.push();
    state.store_log(EventBuilder(ADDRESS, bytes32_t{2}).build());
    state.pop_reject();

    ASSERT_EQ(state.logs().size(), 1);
    EXPECT_EQ(state.logs()[0].topics[0], bytes32_t{1});
    EXPECT_EQ(state.logs()[0].address, ADDRESS);
}
