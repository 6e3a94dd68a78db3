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
#include <bolt/keys/dirk_transport.hpp>
#include <bolt/keys/key_error.hpp>

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/status.h>
#include <quill/Quill.h>

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

BOLT_KEYS_NAMESPACE_BEGIN

namespace
{
    std::optional<std::string> read_pem(std::filesystem::path const &path)
    {
        std::ifstream in{path};
        if (!in) {
            return std::nullopt;
        }
        std::ostringstream contents;
        contents << in.rdbuf();
        return contents.str();
    }

    // gRPC targets carry no scheme
    std::string to_target(std::string const &url)
    {
        for (std::string_view const scheme : {"https://", "http://"}) {
            if (url.starts_with(scheme)) {
                return url.substr(scheme.size());
            }
        }
        return url;
    }

    // Only failures where the signer may not have seen the request are
    // retryable; any other status is the signer's answer.
    KeyError to_key_error(grpc::Status const &status)
    {
        switch (status.error_code()) {
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            return KeyError::RemoteSignerTimeout;
        case grpc::StatusCode::UNAVAILABLE:
        case grpc::StatusCode::CANCELLED:
        case grpc::StatusCode::ABORTED:
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
            return KeyError::ConnectionError;
        default:
            return KeyError::RemoteSignerRejected;
        }
    }

    Result<bool> to_unlocked(v1::ResponseState const state)
    {
        switch (state) {
        case v1::SUCCEEDED:
            return true;
        case v1::DENIED:
            return false;
        default:
            return KeyError::RemoteSignerRejected;
        }
    }
}

DirkTransport::DirkTransport(
    std::shared_ptr<grpc::Channel> channel,
    std::chrono::milliseconds const timeout)
    : channel_{std::move(channel)}
    , lister_{v1::Lister::NewStub(channel_)}
    , signer_{v1::Signer::NewStub(channel_)}
    , account_manager_{v1::AccountManager::NewStub(channel_)}
    , timeout_{timeout}
{
}

Result<std::unique_ptr<DirkTransport>>
DirkTransport::connect(RemoteSignerConfig const &config)
{
    auto cert = read_pem(config.tls.client_cert);
    auto key = read_pem(config.tls.client_key);
    if (!cert.has_value() || !key.has_value()) {
        return ConfigError::MissingTlsCredentials;
    }

    grpc::SslCredentialsOptions options;
    options.pem_cert_chain = std::move(*cert);
    options.pem_private_key = std::move(*key);
    if (config.tls.ca_cert.has_value()) {
        auto ca = read_pem(*config.tls.ca_cert);
        if (!ca.has_value()) {
            return ConfigError::MissingTlsCredentials;
        }
        options.pem_root_certs = std::move(*ca);
    }

    auto channel = grpc::CreateChannel(
        to_target(config.url), grpc::SslCredentials(options));
    LOG_INFO("connecting to remote signer at {}", config.url);
    return std::make_unique<DirkTransport>(std::move(channel), config.timeout);
}

void DirkTransport::set_deadline(grpc::ClientContext &context) const
{
    context.set_deadline(std::chrono::system_clock::now() + timeout_);
}

Result<std::vector<RemoteAccount>>
DirkTransport::list_accounts(std::string const &wallet_path)
{
    v1::ListAccountsRequest request;
    request.add_paths(wallet_path);
    v1::ListAccountsResponse response;
    grpc::ClientContext context;
    set_deadline(context);

    auto const status = lister_->ListAccounts(&context, request, &response);
    if (!status.ok()) {
        LOG_ERROR("ListAccounts failed: {}", status.error_message());
        return to_key_error(status);
    }
    if (response.state() != v1::SUCCEEDED) {
        return KeyError::RemoteSignerRejected;
    }

    std::vector<RemoteAccount> accounts;
    auto const add = [&](std::string const &name, std::string const &pubkey) {
        if (pubkey.size() != crypto::BLS_PUBKEY_SIZE) {
            LOG_WARNING("ignoring remote account {} without a valid key", name);
            return;
        }
        RemoteAccount account{.name = name};
        std::copy_n(pubkey.data(), pubkey.size(), account.pubkey.data());
        accounts.push_back(std::move(account));
    };
    for (auto const &account : response.accounts()) {
        add(account.name(), account.publickey());
    }
    // distributed accounts sign with their composite key
    for (auto const &account : response.distributedaccounts()) {
        add(account.name(), account.compositepublickey());
    }
    return accounts;
}

Result<bool> DirkTransport::unlock(
    std::string const &account, std::string const &passphrase)
{
    v1::UnlockAccountRequest request;
    request.set_account(account);
    request.set_passphrase(passphrase);
    v1::UnlockAccountResponse response;
    grpc::ClientContext context;
    set_deadline(context);

    auto const status = account_manager_->Unlock(&context, request, &response);
    if (!status.ok()) {
        return to_key_error(status);
    }
    return to_unlocked(response.state());
}

Result<bool> DirkTransport::lock(std::string const &account)
{
    v1::LockAccountRequest request;
    request.set_account(account);
    v1::LockAccountResponse response;
    grpc::ClientContext context;
    set_deadline(context);

    auto const status = account_manager_->Lock(&context, request, &response);
    if (!status.ok()) {
        return to_key_error(status);
    }
    return to_unlocked(response.state());
}

Result<crypto::BlsSignatureBytes> DirkTransport::sign(
    std::string const &account, crypto::SigningRequest const &signing)
{
    v1::SignRequest request;
    request.set_account(account);
    request.set_data(signing.object_root.bytes, sizeof(signing.object_root));
    request.set_domain(signing.domain.bytes, sizeof(signing.domain));
    v1::SignResponse response;
    grpc::ClientContext context;
    set_deadline(context);

    auto const status = signer_->Sign(&context, request, &response);
    if (!status.ok()) {
        return to_key_error(status);
    }
    if (response.state() != v1::SUCCEEDED ||
        response.signature().size() != crypto::BLS_SIGNATURE_SIZE) {
        LOG_WARNING(
            "remote signer refused to sign for {} (state {})",
            account,
            static_cast<int>(response.state()));
        return KeyError::RemoteSignerRejected;
    }
    crypto::BlsSignatureBytes signature;
    std::copy_n(
        response.signature().data(),
        signature.size(),
        signature.data());
    return signature;
}

BOLT_KEYS_NAMESPACE_END
