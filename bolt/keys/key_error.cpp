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

#include <bolt/keys/config.hpp>
#include <bolt/keys/key_error.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOLT_KEYS_NAMESPACE_BEGIN

bool is_transport_error(outcome_e::system_code const &error)
{
    return error == KeyError::ConnectionError ||
           error == KeyError::RemoteSignerTimeout;
}

BOLT_KEYS_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<bolt::keys::KeyError>::mapping> const &
quick_status_code_from_enum<bolt::keys::KeyError>::value_mappings()
{
    using bolt::keys::KeyError;

    static std::initializer_list<mapping> const v = {
        {KeyError::Success, "success", {errc::success}},
        {KeyError::KeystoreDecryptionError,
         "keystore decryption failed",
         {}},
        {KeyError::UnknownKeyError, "public key not held by key source", {}},
        {KeyError::InvalidSecretKey, "invalid secret key", {}},
        {KeyError::MissingPassword, "no password for keystore", {}},
        {KeyError::MalformedKeystore, "malformed keystore", {}},
        {KeyError::ConnectionError, "remote signer connection error", {}},
        {KeyError::RemoteSignerTimeout, "remote signer timed out", {}},
        {KeyError::RemoteSignerRejected,
         "remote signer rejected the request",
         {}},
        {KeyError::AccountLocked, "remote account could not be unlocked", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
