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
#include <bolt/keys/key_source_config.hpp>
#include <bolt/keys/proto/dirk.grpc.pb.h>
#include <bolt/keys/remote_signer.hpp>

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

BOLT_KEYS_NAMESPACE_BEGIN

// Dirk v1 signer API over a mutually authenticated gRPC channel.
class DirkTransport final : public RemoteSignerTransport
{
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<v1::Lister::Stub> lister_;
    std::unique_ptr<v1::Signer::Stub> signer_;
    std::unique_ptr<v1::AccountManager::Stub> account_manager_;
    std::chrono::milliseconds timeout_;

    void set_deadline(grpc::ClientContext &) const;

public:
    DirkTransport(std::shared_ptr<grpc::Channel>, std::chrono::milliseconds);

    static Result<std::unique_ptr<DirkTransport>>
    connect(RemoteSignerConfig const &);

    Result<std::vector<RemoteAccount>>
    list_accounts(std::string const &wallet_path) override;

    Result<bool> unlock(
        std::string const &account, std::string const &passphrase) override;

    Result<bool> lock(std::string const &account) override;

    Result<crypto::BlsSignatureBytes>
    sign(std::string const &account, crypto::SigningRequest const &) override;
};

BOLT_KEYS_NAMESPACE_END
