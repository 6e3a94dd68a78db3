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

#include <bolt/core/byte_string.hpp>
#include <bolt/core/bytes.hpp>
#include <bolt/core/config_error.hpp>
#include <bolt/core/hex.hpp>
#include <bolt/crypto/bls.hpp>
#include <bolt/crypto/signing.hpp>
#include <bolt/keys/config.hpp>
#include <bolt/keys/key_error.hpp>
#include <bolt/keys/keystore.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <system_error>

BOLT_KEYS_NAMESPACE_BEGIN

namespace
{
    constexpr size_t DERIVED_KEY_SIZE = 32;

    struct ParsedKeystore
    {
        KdfParams kdf;
        bytes32_t checksum;
        byte_string_fixed<16> iv;
        byte_string ciphertext;
        std::optional<crypto::BlsPubkeyBytes> pubkey;
    };

    // wipes a buffer holding key material when leaving scope
    template <class Buffer>
    struct Cleanse
    {
        Buffer &buffer;

        ~Cleanse()
        {
            OPENSSL_cleanse(buffer.data(), buffer.size());
        }
    };

    template <class Buffer>
    Cleanse(Buffer &) -> Cleanse<Buffer>;

    nlohmann::json const *
    find(nlohmann::json const &object, char const *const key)
    {
        if (!object.is_object()) {
            return nullptr;
        }
        auto const it = object.find(key);
        return it == object.end() ? nullptr : &*it;
    }

    std::optional<std::string>
    find_string(nlohmann::json const &object, char const *const key)
    {
        auto const *const value = find(object, key);
        if (value == nullptr || !value->is_string()) {
            return std::nullopt;
        }
        return value->get<std::string>();
    }

    std::optional<uint64_t>
    find_uint(nlohmann::json const &object, char const *const key)
    {
        auto const *const value = find(object, key);
        if (value == nullptr || !value->is_number_unsigned()) {
            return std::nullopt;
        }
        return value->get<uint64_t>();
    }

    std::optional<byte_string>
    find_hex(nlohmann::json const &object, char const *const key)
    {
        auto const value = find_string(object, key);
        if (!value.has_value()) {
            return std::nullopt;
        }
        return parse_hex(*value);
    }

    Result<KdfParams> parse_kdf(nlohmann::json const &kdf)
    {
        auto const function = find_string(kdf, "function");
        auto const *const params = find(kdf, "params");
        if (!function.has_value() || params == nullptr) {
            return KeyError::MalformedKeystore;
        }
        auto salt = find_hex(*params, "salt");
        auto const dklen = find_uint(*params, "dklen");
        if (!salt.has_value() || dklen != DERIVED_KEY_SIZE) {
            return KeyError::MalformedKeystore;
        }

        KdfParams out{.salt = std::move(*salt)};
        if (*function == "scrypt") {
            auto const n = find_uint(*params, "n");
            auto const r = find_uint(*params, "r");
            auto const p = find_uint(*params, "p");
            if (!n || !r || !p || *r > UINT32_MAX || *p > UINT32_MAX) {
                return KeyError::MalformedKeystore;
            }
            out.function = KdfFunction::Scrypt;
            out.cost = *n;
            out.r = static_cast<uint32_t>(*r);
            out.p = static_cast<uint32_t>(*p);
        }
        else if (*function == "pbkdf2") {
            auto const c = find_uint(*params, "c");
            if (!c || *c == 0 || *c > INT32_MAX ||
                find_string(*params, "prf") != "hmac-sha256") {
                return KeyError::MalformedKeystore;
            }
            out.function = KdfFunction::Pbkdf2;
            out.cost = *c;
        }
        else {
            return KeyError::MalformedKeystore;
        }
        return out;
    }

    Result<ParsedKeystore> parse_keystore(nlohmann::json const &keystore)
    {
        auto const *const crypto = find(keystore, "crypto");
        if (crypto == nullptr) {
            return KeyError::MalformedKeystore;
        }
        auto const *const kdf = find(*crypto, "kdf");
        auto const *const checksum = find(*crypto, "checksum");
        auto const *const cipher = find(*crypto, "cipher");
        if (kdf == nullptr || checksum == nullptr || cipher == nullptr) {
            return KeyError::MalformedKeystore;
        }

        BOOST_OUTCOME_TRY(auto params, parse_kdf(*kdf));
        ParsedKeystore parsed{.kdf = std::move(params)};

        auto const checksum_message = find_hex(*checksum, "message");
        if (find_string(*checksum, "function") != "sha256" ||
            !checksum_message.has_value() || checksum_message->size() != 32) {
            return KeyError::MalformedKeystore;
        }
        parsed.checksum = to_bytes(*checksum_message);

        auto const *const cipher_params = find(*cipher, "params");
        auto const iv = cipher_params == nullptr
                            ? std::nullopt
                            : find_hex(*cipher_params, "iv");
        auto ciphertext = find_hex(*cipher, "message");
        if (find_string(*cipher, "function") != "aes-128-ctr" ||
            !iv.has_value() || iv->size() != parsed.iv.size() ||
            !ciphertext.has_value() || ciphertext->empty()) {
            return KeyError::MalformedKeystore;
        }
        std::copy_n(iv->data(), parsed.iv.size(), parsed.iv.data());
        parsed.ciphertext = std::move(*ciphertext);

        if (auto const pubkey = find_string(keystore, "pubkey")) {
            parsed.pubkey =
                parse_hex_fixed<crypto::BLS_PUBKEY_SIZE>(*pubkey);
            if (!parsed.pubkey.has_value()) {
                return KeyError::MalformedKeystore;
            }
        }
        return parsed;
    }

    Result<byte_string_fixed<DERIVED_KEY_SIZE>>
    derive_key(KdfParams const &kdf, std::string_view const password)
    {
        byte_string_fixed<DERIVED_KEY_SIZE> key;
        int ok = 0;
        if (kdf.function == KdfFunction::Scrypt) {
            uint64_t const maxmem =
                128 * uint64_t{kdf.r} * (kdf.cost + kdf.p + 2) + (1 << 20);
            ok = EVP_PBE_scrypt(
                password.data(),
                password.size(),
                kdf.salt.data(),
                kdf.salt.size(),
                kdf.cost,
                kdf.r,
                kdf.p,
                maxmem,
                key.data(),
                key.size());
        }
        else {
            ok = PKCS5_PBKDF2_HMAC(
                password.data(),
                static_cast<int>(password.size()),
                kdf.salt.data(),
                static_cast<int>(kdf.salt.size()),
                static_cast<int>(kdf.cost),
                EVP_sha256(),
                static_cast<int>(key.size()),
                key.data());
        }
        if (ok != 1) {
            return KeyError::MalformedKeystore;
        }
        return key;
    }

    // AES-128-CTR is its own inverse
    Result<byte_string> aes_128_ctr(
        byte_string_view const key, byte_string_fixed<16> const &iv,
        byte_string_view const input)
    {
        std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(
            EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
        if (!ctx) {
            return KeyError::KeystoreDecryptionError;
        }
        byte_string output(input.size(), 0);
        int len = 0;
        int final_len = 0;
        if (EVP_EncryptInit_ex(
                ctx.get(), EVP_aes_128_ctr(), nullptr, key.data(), iv.data()) !=
                1 ||
            EVP_EncryptUpdate(
                ctx.get(),
                output.data(),
                &len,
                input.data(),
                static_cast<int>(input.size())) != 1 ||
            EVP_EncryptFinal_ex(ctx.get(), output.data() + len, &final_len) !=
                1) {
            OPENSSL_cleanse(output.data(), output.size());
            return KeyError::KeystoreDecryptionError;
        }
        return output;
    }

    bytes32_t checksum(
        byte_string_fixed<DERIVED_KEY_SIZE> const &key,
        byte_string_view const ciphertext)
    {
        byte_string preimage(key.begin() + 16, key.end());
        preimage.append(ciphertext);
        auto const digest = crypto::sha256(preimage);
        OPENSSL_cleanse(preimage.data(), preimage.size());
        return digest;
    }

    std::optional<std::string> read_file(std::filesystem::path const &path)
    {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            return std::nullopt;
        }
        std::ostringstream contents;
        contents << in.rdbuf();
        return contents.str();
    }

    std::string trim_line_ending(std::string s)
    {
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
            s.pop_back();
        }
        return s;
    }

    std::vector<std::filesystem::path>
    list_keystores(std::filesystem::path const &dir)
    {
        std::vector<std::filesystem::path> paths;
        std::error_code ec;
        auto const is_json = [](std::filesystem::directory_entry const &e) {
            std::error_code err;
            return e.is_regular_file(err) && e.path().extension() == ".json";
        };
        for (auto const &entry :
             std::filesystem::directory_iterator{dir, ec}) {
            auto const name = entry.path().filename().string();
            if (entry.is_directory(ec) && name.starts_with("0x")) {
                for (auto const &inner :
                     std::filesystem::directory_iterator{entry.path(), ec}) {
                    if (is_json(inner)) {
                        paths.push_back(inner.path());
                    }
                }
            }
            else if (is_json(entry)) {
                paths.push_back(entry.path());
            }
        }
        std::sort(paths.begin(), paths.end());
        return paths;
    }

    // Pubkey named by the keystore itself, else by its 0x<pubkey> directory.
    // The result names a file under the secrets directory, so it is rebuilt
    // from the parsed key and never taken verbatim from the input.
    std::optional<std::string>
    keystore_pubkey_hex(nlohmann::json const &keystore,
                        std::filesystem::path const &path)
    {
        auto const name = [&]() -> std::optional<std::string> {
            if (auto const pubkey = find_string(keystore, "pubkey")) {
                return *pubkey;
            }
            auto const parent = path.parent_path().filename().string();
            if (parent.starts_with("0x")) {
                return parent;
            }
            return std::nullopt;
        }();
        if (!name.has_value()) {
            return std::nullopt;
        }
        auto const pubkey = parse_hex_fixed<crypto::BLS_PUBKEY_SIZE>(*name);
        if (!pubkey.has_value()) {
            LOG_WARNING("{} names an invalid public key", path.string());
            return std::nullopt;
        }
        return to_hex(to_byte_string_view(*pubkey));
    }

    Result<crypto::BlsSecretKey> load_one(
        std::filesystem::path const &path, KeystoreConfig const &config,
        std::optional<std::string> const &shared_password)
    {
        auto const contents = read_file(path);
        if (!contents.has_value()) {
            return KeyError::MalformedKeystore;
        }
        auto const keystore = nlohmann::json::parse(*contents, nullptr, false);
        if (keystore.is_discarded()) {
            return KeyError::MalformedKeystore;
        }

        if (shared_password.has_value()) {
            return decrypt_keystore(keystore, *shared_password);
        }

        auto const pubkey = keystore_pubkey_hex(keystore, path);
        if (!pubkey.has_value()) {
            return KeyError::MissingPassword;
        }
        auto password = read_file(*config.secrets_path / *pubkey);
        if (!password.has_value()) {
            return KeyError::MissingPassword;
        }
        *password = trim_line_ending(std::move(*password));
        Cleanse const wipe{*password};
        return decrypt_keystore(keystore, *password);
    }
}

std::string normalize_password(std::string_view const password)
{
    std::string out;
    out.reserve(password.size());
    for (size_t i = 0; i < password.size(); ++i) {
        auto const c = static_cast<unsigned char>(password[i]);
        if (c < 0x20 || c == 0x7f) {
            continue;
        }
        // C1 block U+0080..U+009F, two bytes in UTF-8
        if (c == 0xc2 && i + 1 < password.size()) {
            auto const next = static_cast<unsigned char>(password[i + 1]);
            if (next >= 0x80 && next <= 0x9f) {
                ++i;
                continue;
            }
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

Result<crypto::BlsSecretKey> decrypt_keystore(
    nlohmann::json const &keystore, std::string_view const password)
{
    BOOST_OUTCOME_TRY(auto const parsed, parse_keystore(keystore));

    auto normalized = normalize_password(password);
    Cleanse const wipe_password{normalized};
    BOOST_OUTCOME_TRY(auto key, derive_key(parsed.kdf, normalized));
    Cleanse const wipe_key{key};

    if (checksum(key, parsed.ciphertext) != parsed.checksum) {
        return KeyError::KeystoreDecryptionError;
    }

    BOOST_OUTCOME_TRY(
        auto secret,
        aes_128_ctr(
            byte_string_view{key.data(), 16}, parsed.iv, parsed.ciphertext));
    Cleanse const wipe_secret{secret};

    auto sk = crypto::BlsSecretKey::from_bytes(secret);
    if (!sk.has_value()) {
        return KeyError::InvalidSecretKey;
    }
    if (parsed.pubkey.has_value() && sk->public_key() != *parsed.pubkey) {
        return KeyError::MalformedKeystore;
    }
    return std::move(*sk);
}

nlohmann::json encrypt_keystore(
    crypto::BlsSecretKey const &sk, std::string_view const password,
    KdfParams const &kdf, byte_string_fixed<16> const &iv)
{
    auto normalized = normalize_password(password);
    Cleanse const wipe_password{normalized};
    auto key = derive_key(kdf, normalized).value();
    Cleanse const wipe_key{key};

    auto secret = sk.to_bytes();
    Cleanse const wipe_secret{secret};
    auto const ciphertext = aes_128_ctr(
                                byte_string_view{key.data(), 16},
                                iv,
                                to_byte_string_view(secret))
                                .value();

    nlohmann::json kdf_json;
    if (kdf.function == KdfFunction::Scrypt) {
        kdf_json = {
            {"function", "scrypt"},
            {"params",
             {{"dklen", DERIVED_KEY_SIZE},
              {"n", kdf.cost},
              {"r", kdf.r},
              {"p", kdf.p},
              {"salt", to_hex(kdf.salt).substr(2)}}},
            {"message", ""}};
    }
    else {
        kdf_json = {
            {"function", "pbkdf2"},
            {"params",
             {{"dklen", DERIVED_KEY_SIZE},
              {"c", kdf.cost},
              {"prf", "hmac-sha256"},
              {"salt", to_hex(kdf.salt).substr(2)}}},
            {"message", ""}};
    }

    return {
        {"crypto",
         {{"kdf", kdf_json},
          {"checksum",
           {{"function", "sha256"},
            {"params", nlohmann::json::object()},
            {"message",
             to_hex(to_byte_string_view(checksum(key, ciphertext)))
                 .substr(2)}}},
          {"cipher",
           {{"function", "aes-128-ctr"},
            {"params", {{"iv", to_hex(to_byte_string_view(iv)).substr(2)}}},
            {"message", to_hex(ciphertext).substr(2)}}}}},
        {"pubkey", to_hex(to_byte_string_view(sk.public_key())).substr(2)},
        {"path", ""},
        {"version", 4}};
}

Result<KeystoreLoad> load_keystores(KeystoreConfig const &config)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(config.path, ec)) {
        return ConfigError::MalformedKeystoreDirectory;
    }

    std::optional<std::string> shared_password = config.password;
    if (config.password_file.has_value()) {
        shared_password = read_file(*config.password_file);
        if (!shared_password.has_value()) {
            return ConfigError::MissingPasswordSource;
        }
        *shared_password = trim_line_ending(std::move(*shared_password));
    }
    if (!shared_password.has_value() && !config.secrets_path.has_value()) {
        return ConfigError::MissingPasswordSource;
    }

    KeystoreLoad load;
    for (auto const &path : list_keystores(config.path)) {
        auto key = load_one(path, config, shared_password);
        if (key.has_error()) {
            LOG_WARNING(
                "skipping keystore {}: {}",
                path.string(),
                key.error().message().c_str());
            load.failures.push_back({path, std::move(key).assume_error()});
            continue;
        }
        load.keys.push_back(std::move(key).value());
    }
    if (shared_password.has_value()) {
        OPENSSL_cleanse(shared_password->data(), shared_password->size());
    }

    LOG_INFO(
        "loaded {} keystores from {}, {} skipped",
        load.keys.size(),
        config.path.string(),
        load.failures.size());
    return load;
}

BOLT_KEYS_NAMESPACE_END
