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

#include <bolt/core/config_error.hpp>
#include <bolt/keys/config.hpp>
#include <bolt/keys/key_source_config.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <filesystem>
#include <system_error>

BOLT_KEYS_NAMESPACE_BEGIN

Result<void> validate(KeystoreConfig const &config)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(config.path, ec)) {
        return ConfigError::MalformedKeystoreDirectory;
    }
    unsigned const sources = config.password.has_value() +
                             config.password_file.has_value() +
                             config.secrets_path.has_value();
    if (sources != 1) {
        return ConfigError::MissingPasswordSource;
    }
    if (config.secrets_path.has_value() &&
        !std::filesystem::is_directory(*config.secrets_path, ec)) {
        return ConfigError::MissingPasswordSource;
    }
    if (config.password_file.has_value() &&
        !std::filesystem::is_regular_file(*config.password_file, ec)) {
        return ConfigError::MissingPasswordSource;
    }
    return outcome::success();
}

Result<void> validate(RemoteSignerConfig const &config)
{
    if (config.tls.client_cert.empty() || config.tls.client_key.empty()) {
        return ConfigError::MissingTlsCredentials;
    }
    return outcome::success();
}

Result<void> validate(KeySourceConfig const &config)
{
    unsigned const sources = !config.secret_keys.empty() +
                             config.keystore.has_value() +
                             config.remote_signer.has_value();
    if (sources == 0) {
        return ConfigError::MissingKeySource;
    }
    if (sources > 1) {
        return ConfigError::AmbiguousKeySource;
    }
    if (config.keystore.has_value()) {
        BOOST_OUTCOME_TRY(validate(*config.keystore));
    }
    if (config.remote_signer.has_value()) {
        BOOST_OUTCOME_TRY(validate(*config.remote_signer));
    }
    return outcome::success();
}

BOLT_KEYS_NAMESPACE_END
