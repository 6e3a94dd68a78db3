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

#include <bolt/core/hex.hpp>
#include <bolt/crypto/bls.hpp>
#include <bolt/delegation/artifact.hpp>
#include <bolt/delegation/config.hpp>
#include <bolt/delegation/delegation_error.hpp>
#include <bolt/delegation/message.hpp>

#include <boost/outcome/try.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <sstream>

BOLT_DELEGATION_NAMESPACE_BEGIN

namespace
{
    template <size_t N>
    std::optional<byte_string_fixed<N>>
    hex_field(nlohmann::json const &object, char const *const key)
    {
        auto const it = object.find(key);
        if (it == object.end() || !it->is_string()) {
            return std::nullopt;
        }
        return parse_hex_fixed<N>(it->get<std::string>());
    }

    std::optional<uint64_t>
    uint_field(nlohmann::json const &object, char const *const key)
    {
        auto const it = object.find(key);
        if (it == object.end() || !it->is_number_unsigned()) {
            return std::nullopt;
        }
        return it->get<uint64_t>();
    }
}

nlohmann::json to_json(DelegationMessage const &message)
{
    return {
        {"message",
         {{"action", static_cast<unsigned>(message.action)},
          {"chain_id", message.chain_id},
          {"validator_pubkey",
           to_hex(to_byte_string_view(message.validator_pubkey))},
          {"delegatee_pubkey",
           to_hex(to_byte_string_view(message.delegatee_pubkey))}}},
        {"signature", to_hex(to_byte_string_view(message.signature))}};
}

Result<DelegationMessage> from_json(nlohmann::json const &record)
{
    if (!record.is_object()) {
        return DelegationError::MalformedRecord;
    }
    auto const it = record.find("message");
    if (it == record.end() || !it->is_object()) {
        return DelegationError::MalformedRecord;
    }
    auto const &body = *it;

    auto const action = uint_field(body, "action");
    auto const chain_id = uint_field(body, "chain_id");
    auto const validator = hex_field<crypto::BLS_PUBKEY_SIZE>(
        body, "validator_pubkey");
    auto const delegatee = hex_field<crypto::BLS_PUBKEY_SIZE>(
        body, "delegatee_pubkey");
    auto const signature = hex_field<crypto::BLS_SIGNATURE_SIZE>(
        record, "signature");
    if (!action || !chain_id || !validator || !delegatee || !signature) {
        return DelegationError::MalformedRecord;
    }

    BOOST_OUTCOME_TRY(auto const checked_action, to_action(*action));
    return DelegationMessage{
        .action = checked_action,
        .chain_id = *chain_id,
        .validator_pubkey = *validator,
        .delegatee_pubkey = *delegatee,
        .signature = *signature};
}

std::string write_artifact(std::vector<DelegationMessage> const &messages)
{
    auto records = nlohmann::json::array();
    for (auto const &message : messages) {
        records.push_back(to_json(message));
    }
    return records.dump(2);
}

Result<std::vector<Result<DelegationMessage>>>
parse_artifact(std::string_view const document)
{
    auto const records = nlohmann::json::parse(document, nullptr, false);
    if (records.is_discarded() || !records.is_array()) {
        return DelegationError::MalformedRecord;
    }
    std::vector<Result<DelegationMessage>> messages;
    messages.reserve(records.size());
    for (auto const &record : records) {
        messages.push_back(from_json(record));
    }
    return messages;
}

Result<std::vector<Result<DelegationMessage>>>
read_artifact(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        return DelegationError::MalformedRecord;
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return parse_artifact(contents.str());
}

BOLT_DELEGATION_NAMESPACE_END
