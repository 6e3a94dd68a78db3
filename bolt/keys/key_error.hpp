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
#include <bolt/keys/config.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOLT_KEYS_NAMESPACE_BEGIN

enum class KeyError
{
    Success = 0,
    KeystoreDecryptionError,
    UnknownKeyError,
    InvalidSecretKey,
    MissingPassword,
    MalformedKeystore,
    ConnectionError,
    RemoteSignerTimeout,
    RemoteSignerRejected,
    AccountLocked,
};

// Failures worth retrying. A rejection by the remote signer is not one.
bool is_transport_error(outcome_e::system_code const &);

BOLT_KEYS_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<bolt::keys::KeyError>
    : quick_status_code_from_enum_defaults<bolt::keys::KeyError>
{
    static constexpr auto const domain_name = "Key Error";
    static constexpr auto const domain_uuid =
        "a3c9e512-7d40-4f1b-8e6a-0c5b2d9f4e71";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
