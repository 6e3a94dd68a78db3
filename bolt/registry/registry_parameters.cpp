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
#include <bolt/core/fmt/address_fmt.hpp> // NOLINT
#include <bolt/registry/config.hpp>
#include <bolt/registry/registry_error.hpp>
#include <bolt/registry/registry_parameters.hpp>

#include <boost/outcome/success_failure.hpp>

#include <quill/Quill.h>

BOLT_REGISTRY_NAMESPACE_BEGIN

RegistryParameters::RegistryParameters(
    Address const &admin, bool const allow_unsafe_registration)
    : admin_{admin}
    , allow_unsafe_registration_{allow_unsafe_registration}
{
}

Result<void> RegistryParameters::set_allow_unsafe_registration(
    Address const &caller, bool const value)
{
    if (caller != admin_) {
        LOG_WARNING(
            "{} may not change allow_unsafe_registration, admin is {}",
            caller,
            admin_);
        return RegistryError::UnauthorizedCaller;
    }
    if (value != allow_unsafe_registration_) {
        LOG_INFO("allow_unsafe_registration set to {}", value);
    }
    allow_unsafe_registration_ = value;
    return outcome::success();
}

BOLT_REGISTRY_NAMESPACE_END
