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

#include <bolt/core/result.hpp>
#include <bolt/delegation/config.hpp>
#include <bolt/delegation/message.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

BOLT_DELEGATION_NAMESPACE_BEGIN

/*
 * Delegation artifact: a JSON array, in apply order, of
 *
 *   {"message": {"action": 0, "chain_id": 17000,
 *                "validator_pubkey": "0x..", "delegatee_pubkey": "0x.."},
 *    "signature": "0x.."}
 */

nlohmann::json to_json(DelegationMessage const &);

Result<DelegationMessage> from_json(nlohmann::json const &);

std::string write_artifact(std::vector<DelegationMessage> const &);

// One result per record: a malformed record never hides the others. Only a
// document that is not a JSON array fails as a whole.
Result<std::vector<Result<DelegationMessage>>>
parse_artifact(std::string_view);

Result<std::vector<Result<DelegationMessage>>>
read_artifact(std::filesystem::path const &);

BOLT_DELEGATION_NAMESPACE_END
