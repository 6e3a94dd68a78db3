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
#include <bolt/core/result.hpp>
#include <bolt/registry/config.hpp>

BOLT_REGISTRY_NAMESPACE_BEGIN

/**
 * Administrative parameters of the registry. Injected at construction;
 * only the admin may change them afterwards.
 */
class RegistryParameters
{
    Address admin_;
    bool allow_unsafe_registration_;

public:
    explicit RegistryParameters(
        Address const &admin, bool allow_unsafe_registration = false);

    Address const &admin() const noexcept
    {
        return admin_;
    }

    // gates register_validator_unsafe, off unless enabled
    bool allow_unsafe_registration() const noexcept
    {
        return allow_unsafe_registration_;
    }

    Result<void>
    set_allow_unsafe_registration(Address const &caller, bool value);
};

BOLT_REGISTRY_NAMESPACE_END
