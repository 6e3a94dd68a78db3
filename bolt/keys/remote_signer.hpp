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
#include <bolt/crypto/bls.hpp>
#include <bolt/crypto/signing.hpp>
#include <bolt/keys/config.hpp>

#include <memory>
#include <string>
#include <vector>

BOLT_KEYS_NAMESPACE_BEGIN

struct RemoteAccount
{
    std::string name;
    crypto::BlsPubkeyBytes pubkey;
};

// Wire protocol of a remote signing service. Implementations report
// ConnectionError / RemoteSignerTimeout for transport failures and
// RemoteSignerRejected when the service answered but refused.
class RemoteSignerTransport
{
public:
    virtual ~RemoteSignerTransport() = default;

    virtual Result<std::vector<RemoteAccount>>
    list_accounts(std::string const &wallet_path) = 0;

    // false when the passphrase was denied
    virtual Result<bool>
    unlock(std::string const &account, std::string const &passphrase) = 0;

    virtual Result<bool> lock(std::string const &account) = 0;

    virtual Result<crypto::BlsSignatureBytes>
    sign(std::string const &account, crypto::SigningRequest const &) = 0;
};

class RemoteSigner
{
    std::unique_ptr<RemoteSignerTransport> transport_;
    std::vector<std::string> passphrases_;
    std::vector<RemoteAccount> accounts_;

    RemoteSigner(
        std::unique_ptr<RemoteSignerTransport>, std::vector<std::string>,
        std::vector<RemoteAccount>);

    Result<void> unlock(RemoteAccount const &);

public:
    RemoteSigner(RemoteSigner &&) = default;
    RemoteSigner &operator=(RemoteSigner &&) = default;
    ~RemoteSigner();

    // lists the accounts under wallet_path once, up front
    static Result<RemoteSigner> connect(
        std::unique_ptr<RemoteSignerTransport>, std::string const &wallet_path,
        std::vector<std::string> passphrases);

    std::vector<crypto::BlsPubkeyBytes> public_keys() const;

    Result<crypto::BlsSignatureBytes>
    sign(crypto::BlsPubkeyBytes const &, crypto::SigningRequest const &);
};

BOLT_KEYS_NAMESPACE_END
