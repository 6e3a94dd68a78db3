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

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

BOLT_KEYS_NAMESPACE_BEGIN

struct TlsCredentials
{
    std::filesystem::path client_cert{};
    std::filesystem::path client_key{};
    std::optional<std::filesystem::path> ca_cert{};
};

// EIP-2335 keystores. Exactly one password source must be set.
struct KeystoreConfig
{
    std::filesystem::path path{};
    std::optional<std::string> password{};
    std::optional<std::filesystem::path> password_file{};
    // one file per validator, named 0x<pubkey>
    std::optional<std::filesystem::path> secrets_path{};
};

struct RemoteSignerConfig
{
    std::string url{};
    TlsCredentials tls{};
    std::string wallet_path{};
    std::vector<std::string> passphrases{};
    std::chrono::milliseconds timeout{std::chrono::seconds{10}};
};

struct KeySourceConfig
{
    std::vector<std::string> secret_keys{};
    std::optional<KeystoreConfig> keystore{};
    std::optional<RemoteSignerConfig> remote_signer{};
};

Result<void> validate(KeystoreConfig const &);

Result<void> validate(RemoteSignerConfig const &);

// exactly one source, and that source must be complete
Result<void> validate(KeySourceConfig const &);

BOLT_KEYS_NAMESPACE_END
