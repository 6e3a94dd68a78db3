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
#include "chain_option.hpp"

#include <bolt/crypto/chain.hpp>

#include <CLI/CLI.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace bolt;

namespace
{
    struct ChainOption : public ::testing::Test
    {
        CLI::App app{"test"};
        crypto::Chain chain{crypto::Chain::Mainnet};

        ChainOption()
        {
            app.add_option("--chain", chain)
                ->transform(chain_transformer())
                ->required();
        }

        void parse(std::string const &name)
        {
            std::vector<std::string> args{name, "--chain"};
            app.parse(args);
        }
    };
}

TEST_F(ChainOption, every_known_chain)
{
    for (auto const c :
         {crypto::Chain::Mainnet,
          crypto::Chain::Holesky,
          crypto::Chain::Helder,
          crypto::Chain::Kurtosis}) {
        parse(std::string{crypto::chain_name(c)});
        EXPECT_EQ(chain, c);
    }
}

TEST_F(ChainOption, ignores_case)
{
    parse("Holesky");
    EXPECT_EQ(chain, crypto::Chain::Holesky);
}

TEST_F(ChainOption, rejects_unknown)
{
    EXPECT_THROW(parse("sepolia"), CLI::ValidationError);
    EXPECT_THROW(parse("1"), CLI::ValidationError);
}
