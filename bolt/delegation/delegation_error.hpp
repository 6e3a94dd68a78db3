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

#include <bolt/delegation/config.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOLT_DELEGATION_NAMESPACE_BEGIN

// Reasons a delegation record is rejected. For authorization they are all
// the same answer; they differ for diagnostics.
enum class DelegationError
{
    Success = 0,
    BadSignature,
    MalformedPoint,
    WrongChain,
    MalformedRecord,
    UnknownAction,
};

BOLT_DELEGATION_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<bolt::delegation::DelegationError>
    : quick_status_code_from_enum_defaults<bolt::delegation::DelegationError>
{
    static constexpr auto const domain_name = "Delegation Error";
    static constexpr auto const domain_uuid =
        "0e4d7b93-58a1-4c26-b3f0-91d2a6c84e17";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
