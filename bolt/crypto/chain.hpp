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

#include <bolt/core/byte_string.hpp>
#include <bolt/core/result.hpp>
#include <bolt/crypto/config.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

BOLT_CRYPTO_NAMESPACE_BEGIN

using ForkVersion = byte_string_fixed<4>;

enum class Chain : uint8_t
{
    Mainnet,
    Holesky,
    Helder,
    Kurtosis,
};

uint64_t chain_id(Chain) noexcept;

// consensus layer genesis fork version
ForkVersion fork_version(Chain) noexcept;

std::string_view chain_name(Chain) noexcept;

std::optional<Chain> chain_from_id(uint64_t) noexcept;

// case insensitive
Result<Chain> parse_chain(std::string_view name);

BOLT_CRYPTO_NAMESPACE_END
