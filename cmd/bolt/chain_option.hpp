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

#include <bolt/core/config.hpp>
#include <bolt/crypto/chain.hpp>

#include <CLI/CLI.hpp>

#include <string>

BOLT_NAMESPACE_BEGIN

// Rewrites a chain name to the enum value CLI11 parses into crypto::Chain.
inline CLI::Validator chain_transformer()
{
    return CLI::Validator(
        [](std::string &input) -> std::string {
            auto const chain = crypto::parse_chain(input);
            if (chain.has_error()) {
                return "unknown chain " + input;
            }
            input = std::to_string(static_cast<unsigned>(chain.value()));
            return {};
        },
        "CHAIN",
        "chain");
}

BOLT_NAMESPACE_END
