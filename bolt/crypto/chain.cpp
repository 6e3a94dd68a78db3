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

#include <bolt/core/assert.h>
#include <bolt/core/config_error.hpp>
#include <bolt/crypto/chain.hpp>
#include <bolt/crypto/config.hpp>

#include <array>
#include <cctype>
#include <optional>

BOLT_CRYPTO_NAMESPACE_BEGIN

BOLT_ANONYMOUS_NAMESPACE_BEGIN

struct ChainInfo
{
    Chain chain;
    std::string_view name;
    uint64_t id;
    ForkVersion fork_version;
};

constexpr std::array<ChainInfo, 4> CHAINS = {{
    {Chain::Mainnet, "mainnet", 1, {0x00, 0x00, 0x00, 0x00}},
    {Chain::Holesky, "holesky", 17000, {0x01, 0x01, 0x70, 0x00}},
    {Chain::Helder, "helder", 7014190335, {0x10, 0x00, 0x00, 0x00}},
    {Chain::Kurtosis, "kurtosis", 3151908, {0x10, 0x00, 0x00, 0x38}},
}};

ChainInfo const &info(Chain const chain)
{
    for (auto const &c : CHAINS) {
        if (c.chain == chain) {
            return c;
        }
    }
    BOLT_ABORT("unhandled chain");
}

BOLT_ANONYMOUS_NAMESPACE_END

uint64_t chain_id(Chain const chain) noexcept
{
    return info(chain).id;
}

ForkVersion fork_version(Chain const chain) noexcept
{
    return info(chain).fork_version;
}

std::string_view chain_name(Chain const chain) noexcept
{
    return info(chain).name;
}

std::optional<Chain> chain_from_id(uint64_t const id) noexcept
{
    for (auto const &c : CHAINS) {
        if (c.id == id) {
            return c.chain;
        }
    }
    return std::nullopt;
}

Result<Chain> parse_chain(std::string_view const name)
{
    for (auto const &c : CHAINS) {
        if (c.name.size() != name.size()) {
            continue;
        }
        bool match = true;
        for (size_t i = 0; i < name.size() && match; ++i) {
            match = std::tolower(static_cast<unsigned char>(name[i])) ==
                    c.name[i];
        }
        if (match) {
            return c.chain;
        }
    }
    return ConfigError::UnknownChain;
}

BOLT_CRYPTO_NAMESPACE_END
