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

#include <bolt/core/config.hpp>
#include <bolt/core/fiber/priority_pool.hpp>
#include <bolt/core/hex.hpp>
#include <bolt/core/likely.h>
#include <bolt/core/log_level_map.hpp>
#include <bolt/core/result.hpp>
#include <bolt/crypto/bls.hpp>
#include <bolt/crypto/chain.hpp>
#include <bolt/delegation/artifact.hpp>
#include <bolt/delegation/delegation_store.hpp>
#include <bolt/delegation/message.hpp>
#include <bolt/delegation/signer.hpp>
#include <bolt/delegation/verifier.hpp>
#include <bolt/keys/key_source.hpp>
#include <bolt/keys/key_source_config.hpp>

#include "chain_option.hpp"

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <nlohmann/json.hpp>

#include <boost/outcome/try.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

using namespace bolt;
namespace fs = std::filesystem;

BOLT_ANONYMOUS_NAMESPACE_BEGIN

std::unordered_map<std::string, delegation::Action> const ACTION_MAP = {
    {"delegate", delegation::Action::Delegate},
    {"revoke", delegation::Action::Revoke}};

struct DelegateArgs
{
    crypto::Chain chain{crypto::Chain::Mainnet};
    delegation::Action action{delegation::Action::Delegate};
    std::string delegatee_pubkey;
    std::string out{"-"};

    std::vector<std::string> secret_keys;
    std::optional<fs::path> keystore_path;
    std::optional<std::string> keystore_password;
    std::optional<fs::path> keystore_password_file;
    std::optional<fs::path> keystore_secrets_path;
    std::optional<std::string> dirk_url;
    fs::path dirk_client_cert;
    fs::path dirk_client_key;
    std::optional<fs::path> dirk_ca_cert;
    std::string dirk_wallet_path;
    std::vector<std::string> dirk_passphrases;
    unsigned dirk_timeout_ms = 10'000;
};

struct VerifyArgs
{
    crypto::Chain chain{crypto::Chain::Mainnet};
    fs::path delegations;
    unsigned nthreads = 4;
    unsigned nfibers = 256;
};

keys::KeySourceConfig to_key_source_config(DelegateArgs const &args)
{
    keys::KeySourceConfig config{.secret_keys = args.secret_keys};
    if (args.keystore_path.has_value()) {
        config.keystore = keys::KeystoreConfig{
            .path = *args.keystore_path,
            .password = args.keystore_password,
            .password_file = args.keystore_password_file,
            .secrets_path = args.keystore_secrets_path};
    }
    if (args.dirk_url.has_value()) {
        config.remote_signer = keys::RemoteSignerConfig{
            .url = *args.dirk_url,
            .tls =
                {.client_cert = args.dirk_client_cert,
                 .client_key = args.dirk_client_key,
                 .ca_cert = args.dirk_ca_cert},
            .wallet_path = args.dirk_wallet_path,
            .passphrases = args.dirk_passphrases,
            .timeout = std::chrono::milliseconds{args.dirk_timeout_ms}};
    }
    return config;
}

Result<void> run_delegate(DelegateArgs const &args)
{
    auto const config = to_key_source_config(args);
    BOOST_OUTCOME_TRY(keys::validate(config));

    // checked by the option validator
    auto const delegatee =
        parse_hex_fixed<crypto::BLS_PUBKEY_SIZE>(args.delegatee_pubkey).value();

    BOOST_OUTCOME_TRY(auto source, keys::make_key_source(config));
    BOOST_OUTCOME_TRY(
        auto const messages,
        delegation::sign_delegations(
            source, delegatee, args.action, args.chain));

    auto const artifact = delegation::write_artifact(messages);
    if (args.out == "-") {
        std::cout << artifact << std::endl;
    }
    else {
        std::ofstream out{args.out};
        out << artifact << '\n';
        if (BOLT_UNLIKELY(!out)) {
            throw std::runtime_error("failed to write " + args.out);
        }
    }
    LOG_INFO(
        "wrote {} {} message(s) for chain {} to {}",
        messages.size(),
        delegation::action_name(args.action),
        crypto::chain_name(args.chain),
        args.out);
    return outcome::success();
}

Result<void> run_verify(VerifyArgs const &args)
{
    BOOST_OUTCOME_TRY(
        auto records, delegation::read_artifact(args.delegations));

    fiber::PriorityPool pool{args.nthreads, args.nfibers};
    delegation::DelegationVerifier const verifier{args.chain};
    auto const store =
        delegation::DelegationStore::load(std::move(records), verifier, pool);

    nlohmann::json active = nlohmann::json::object();
    for (auto const &[validator, delegatee] : store.delegations()) {
        active[to_hex(to_byte_string_view(validator))] =
            to_hex(to_byte_string_view(delegatee));
    }
    std::cout << active.dump(2) << std::endl;
    return outcome::success();
}

std::string check_pubkey_hex(std::string const &s)
{
    if (!parse_hex_fixed<crypto::BLS_PUBKEY_SIZE>(s).has_value()) {
        return "expected a 48 byte hex encoded public key";
    }
    return "";
}

BOLT_ANONYMOUS_NAMESPACE_END

int main(int const argc, char const *argv[])
{
    CLI::App cli{"bolt"};
    cli.option_defaults()->always_capture_default();
    cli.require_subcommand(1);

    auto log_level = quill::LogLevel::Info;
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    DelegateArgs delegate_args;
    auto *const delegate = cli.add_subcommand(
        "delegate", "sign delegation or revocation messages for every key");
    delegate->add_option("--chain", delegate_args.chain, "target chain")
        ->transform(chain_transformer())
        ->required();
    delegate->add_option("--action", delegate_args.action, "message action")
        ->transform(CLI::CheckedTransformer(ACTION_MAP, CLI::ignore_case));
    delegate
        ->add_option(
            "--delegatee-pubkey",
            delegate_args.delegatee_pubkey,
            "compressed BLS public key of the delegatee")
        ->check(check_pubkey_hex)
        ->required();
    delegate->add_option(
        "--out", delegate_args.out, "artifact path, - for stdout");

    auto *const sources =
        delegate->add_option_group("key source", "where validator keys live");
    sources->add_option(
        "--secret-keys",
        delegate_args.secret_keys,
        "hex encoded BLS secret keys");
    sources
        ->add_option(
            "--keystore-path",
            delegate_args.keystore_path,
            "directory of EIP-2335 keystores")
        ->check(CLI::ExistingDirectory);
    sources->add_option(
        "--dirk-url", delegate_args.dirk_url, "remote signer endpoint");
    sources->require_option(1);

    delegate->add_option(
        "--keystore-password",
        delegate_args.keystore_password,
        "password shared by every keystore");
    delegate
        ->add_option(
            "--keystore-password-file",
            delegate_args.keystore_password_file,
            "file holding the shared keystore password")
        ->check(CLI::ExistingFile);
    delegate
        ->add_option(
            "--keystore-secrets-path",
            delegate_args.keystore_secrets_path,
            "directory of per key password files")
        ->check(CLI::ExistingDirectory);
    delegate->add_option(
        "--dirk-client-cert",
        delegate_args.dirk_client_cert,
        "client certificate for mutual TLS");
    delegate->add_option(
        "--dirk-client-key",
        delegate_args.dirk_client_key,
        "client private key for mutual TLS");
    delegate->add_option(
        "--dirk-ca-cert",
        delegate_args.dirk_ca_cert,
        "CA certificate of the remote signer");
    delegate->add_option(
        "--dirk-wallet-path",
        delegate_args.dirk_wallet_path,
        "wallet holding the validator accounts");
    delegate->add_option(
        "--dirk-passphrases",
        delegate_args.dirk_passphrases,
        "passphrases used to unlock accounts");
    delegate->add_option(
        "--dirk-timeout-ms",
        delegate_args.dirk_timeout_ms,
        "deadline of each remote signer call");

    VerifyArgs verify_args;
    auto *const verify = cli.add_subcommand(
        "verify", "load a delegation artifact and print active delegations");
    verify->add_option("--chain", verify_args.chain, "target chain")
        ->transform(chain_transformer())
        ->required();
    verify
        ->add_option(
            "--delegations",
            verify_args.delegations,
            "delegation artifact to load")
        ->check(CLI::ExistingFile)
        ->required();
    verify->add_option("--nthreads", verify_args.nthreads, "number of threads");
    verify->add_option("--nfibers", verify_args.nfibers, "number of fibers");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    // stdout carries the artifact, so logs go to stderr
    auto stderr_handler = quill::stderr_handler();
    stderr_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stderr_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto const result =
        delegate->parsed() ? run_delegate(delegate_args) : run_verify(verify_args);

    if (BOLT_UNLIKELY(result.has_error())) {
        LOG_ERROR("bolt failed with: {}", result.assume_error().message().c_str());
    }
    quill::flush();
    return result.has_error() ? EXIT_FAILURE : EXIT_SUCCESS;
}
