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

#include <bolt/core/hex.hpp>
#include <bolt/keys/config.hpp>
#include <bolt/keys/key_error.hpp>
#include <bolt/keys/remote_signer.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <openssl/crypto.h>
#include <quill/Quill.h>

#include <algorithm>
#include <utility>

BOLT_KEYS_NAMESPACE_BEGIN

RemoteSigner::RemoteSigner(
    std::unique_ptr<RemoteSignerTransport> transport,
    std::vector<std::string> passphrases, std::vector<RemoteAccount> accounts)
    : transport_{std::move(transport)}
    , passphrases_{std::move(passphrases)}
    , accounts_{std::move(accounts)}
{
}

RemoteSigner::~RemoteSigner()
{
    for (auto &passphrase : passphrases_) {
        OPENSSL_cleanse(passphrase.data(), passphrase.size());
    }
}

Result<RemoteSigner> RemoteSigner::connect(
    std::unique_ptr<RemoteSignerTransport> transport,
    std::string const &wallet_path, std::vector<std::string> passphrases)
{
    BOOST_OUTCOME_TRY(auto accounts, transport->list_accounts(wallet_path));
    LOG_INFO(
        "remote signer lists {} accounts under {}",
        accounts.size(),
        wallet_path);
    return RemoteSigner{
        std::move(transport), std::move(passphrases), std::move(accounts)};
}

std::vector<crypto::BlsPubkeyBytes> RemoteSigner::public_keys() const
{
    std::vector<crypto::BlsPubkeyBytes> keys;
    keys.reserve(accounts_.size());
    for (auto const &account : accounts_) {
        keys.push_back(account.pubkey);
    }
    return keys;
}

Result<void> RemoteSigner::unlock(RemoteAccount const &account)
{
    for (auto const &passphrase : passphrases_) {
        BOOST_OUTCOME_TRY(
            auto const unlocked, transport_->unlock(account.name, passphrase));
        if (unlocked) {
            LOG_DEBUG("unlocked remote account {}", account.name);
            return outcome::success();
        }
    }
    return KeyError::AccountLocked;
}

Result<crypto::BlsSignatureBytes> RemoteSigner::sign(
    crypto::BlsPubkeyBytes const &pubkey,
    crypto::SigningRequest const &request)
{
    auto const it = std::find_if(
        accounts_.begin(), accounts_.end(), [&](RemoteAccount const &a) {
            return a.pubkey == pubkey;
        });
    if (it == accounts_.end()) {
        return KeyError::UnknownKeyError;
    }

    BOOST_OUTCOME_TRY(unlock(*it));
    auto signature = transport_->sign(it->name, request);

    // the signature is usable even if the account stays unlocked
    auto const locked = transport_->lock(it->name);
    if (locked.has_error()) {
        LOG_WARNING(
            "failed to lock remote account {}: {}",
            it->name,
            locked.error().message().c_str());
    }
    else if (!locked.value()) {
        LOG_WARNING("remote signer denied locking account {}", it->name);
    }
    return signature;
}

BOLT_KEYS_NAMESPACE_END
