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
#include <bolt/core/byte_string.hpp>
#include <bolt/core/fiber/priority_pool.hpp>
#include <bolt/core/hex.hpp>
#include <bolt/delegation/config.hpp>
#include <bolt/delegation/delegation_store.hpp>
#include <bolt/delegation/message.hpp>
#include <bolt/delegation/verifier.hpp>

#include <boost/fiber/future/promise.hpp>

#include <quill/Quill.h>

#include <memory>
#include <optional>
#include <utility>
#include <vector>

BOLT_DELEGATION_NAMESPACE_BEGIN

namespace
{
    std::vector<std::optional<Result<void>>> verify_all(
        std::vector<Result<DelegationMessage>> const &records,
        DelegationVerifier const &verifier, fiber::PriorityPool &priority_pool)
    {
        std::vector<std::optional<Result<void>>> verdicts{records.size()};

        std::shared_ptr<boost::fibers::promise<void>[]> promises{
            new boost::fibers::promise<void>[records.size()]};

        for (unsigned i = 0; i < records.size(); ++i) {
            if (records[i].has_error()) {
                promises[i].set_value();
                continue;
            }
            priority_pool.submit(
                i,
                [i = i,
                 promises = promises,
                 &verdict = verdicts[i],
                 &message = records[i].value(),
                 &verifier] {
                    verdict.emplace(verifier.verify(message));
                    promises[i].set_value();
                });
        }

        for (unsigned i = 0; i < records.size(); ++i) {
            promises[i].get_future().wait();
        }

        return verdicts;
    }
}

DelegationStore DelegationStore::load(
    std::vector<Result<DelegationMessage>> records,
    DelegationVerifier const &verifier, fiber::PriorityPool &priority_pool)
{
    auto verdicts = verify_all(records, verifier, priority_pool);

    DelegationStore store;
    auto &report = store.report_;
    auto const drop = [&report](
                          size_t const index, outcome_e::system_code error) {
        LOG_WARNING(
            "dropping delegation record {}: {}",
            index,
            error.message().c_str());
        report.dropped.push_back(
            DroppedRecord{.index = index, .error = std::move(error)});
    };

    for (size_t i = 0; i < records.size(); ++i) {
        if (records[i].has_error()) {
            drop(i, std::move(records[i]).error());
            continue;
        }
        BOLT_ASSERT(verdicts[i].has_value());
        if (verdicts[i]->has_error()) {
            drop(i, std::move(*verdicts[i]).error());
            continue;
        }

        auto const &message = records[i].value();
        auto const it = store.delegations_.find(message.validator_pubkey);
        switch (message.action) {
        case Action::Delegate:
            store.delegations_.insert_or_assign(
                message.validator_pubkey, message.delegatee_pubkey);
            ++report.accepted;
            break;
        case Action::Revoke:
            if (it == store.delegations_.end() ||
                it->second != message.delegatee_pubkey) {
                LOG_WARNING(
                    "ignoring record {}: {} has no active delegation to {}",
                    i,
                    to_hex(to_byte_string_view(message.validator_pubkey)),
                    to_hex(to_byte_string_view(message.delegatee_pubkey)));
                report.ignored.push_back(i);
                break;
            }
            store.delegations_.erase(it);
            ++report.accepted;
            break;
        }
    }

    LOG_INFO(
        "loaded {} delegation records: {} accepted, {} dropped, {} ignored, "
        "{} active delegations",
        records.size(),
        report.accepted,
        report.dropped.size(),
        report.ignored.size(),
        store.delegations_.size());
    return store;
}

std::optional<crypto::BlsPubkeyBytes>
DelegationStore::resolve_signer(crypto::BlsPubkeyBytes const &validator) const
{
    auto const it = delegations_.find(validator);
    if (it == delegations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

BOLT_DELEGATION_NAMESPACE_END
