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

#include <bolt/core/byte_string.hpp>
#include <bolt/core/result.hpp>
#include <bolt/crypto/bls.hpp>
#include <bolt/keys/config.hpp>
#include <bolt/keys/key_source_config.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

BOLT_KEYS_NAMESPACE_BEGIN

enum class KdfFunction : uint8_t
{
    Scrypt,
    Pbkdf2,
};

struct KdfParams
{
    KdfFunction function{KdfFunction::Scrypt};
    // scrypt N or pbkdf2 iteration count
    uint64_t cost{262144};
    uint32_t r{8};
    uint32_t p{1};
    byte_string salt{};
};

// Removes C0 and C1 control characters, as EIP-2335 requires before the
// password is fed to the KDF. NFKD is not applied: non ASCII passwords must
// already be NFKD normalized UTF-8 and are otherwise passed through as is.
std::string normalize_password(std::string_view);

Result<crypto::BlsSecretKey>
decrypt_keystore(nlohmann::json const &keystore, std::string_view password);

nlohmann::json encrypt_keystore(
    crypto::BlsSecretKey const &, std::string_view password,
    KdfParams const &, byte_string_fixed<16> const &iv);

struct KeystoreFailure
{
    std::filesystem::path path;
    outcome_e::system_code error;
};

struct KeystoreLoad
{
    std::vector<crypto::BlsSecretKey> keys;
    std::vector<KeystoreFailure> failures;
};

/**
 * Decrypts every keystore of the directory, either laid out as
 * <path>/0x<pubkey>/<keystore>.json or as <path>/<keystore>.json.
 * Entries that fail to decrypt are skipped and listed in the result;
 * only an unusable directory or password source fails the whole load.
 */
Result<KeystoreLoad> load_keystores(KeystoreConfig const &);

BOLT_KEYS_NAMESPACE_END
