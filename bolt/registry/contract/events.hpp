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

#include <bolt/core/address.hpp>
#include <bolt/core/byte_string.hpp>
#include <bolt/core/bytes.hpp>
#include <bolt/registry/config.hpp>
#include <bolt/registry/contract/log.hpp>

#include <utility>

BOLT_REGISTRY_NAMESPACE_BEGIN

class EventBuilder
{
    Log event_;

public:
    explicit EventBuilder(Address const &account, bytes32_t const &signature)
    {
        event_.address = account;
        event_.topics.push_back(signature);
    }

    // indexed parameter
    EventBuilder &&add_topic(bytes32_t const &topic) &&
    {
        event_.topics.push_back(topic);
        return std::move(*this);
    }

    // non-indexed parameter, already abi encoded
    EventBuilder &&add_data(byte_string_view const data) &&
    {
        event_.data += data;
        return std::move(*this);
    }

    Log &&build() &&
    {
        return std::move(event_);
    }
};

BOLT_REGISTRY_NAMESPACE_END
