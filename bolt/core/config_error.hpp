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

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOLT_NAMESPACE_BEGIN

// Pre-flight failures. Any of these aborts start-up before key material is
// touched.
enum class ConfigError
{
    Success = 0,
    MissingKeySource,
    AmbiguousKeySource,
    MalformedKeystoreDirectory,
    MissingPasswordSource,
    MissingTlsCredentials,
    UnknownChain,
};

BOLT_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<bolt::ConfigError>
    : quick_status_code_from_enum_defaults<bolt::ConfigError>
{
    static constexpr auto const domain_name = "Config Error";
    static constexpr auto const domain_uuid =
        "6b1f0d8e-35c2-4a57-9e0b-2f4c1d7a8e53";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
