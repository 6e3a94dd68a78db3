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

#include <bolt/core/address.hpp>
#include <bolt/core/big_endian.hpp>
#include <bolt/core/byte_string.hpp>
#include <bolt/core/bytes.hpp>
#include <bolt/core/result.hpp>
#include <bolt/crypto/bls.hpp>
#include <bolt/crypto/chain.hpp>
#include <bolt/delegation/message.hpp>
#include <bolt/delegation/verifier.hpp>
#include <bolt/registry/config.hpp>
#include <bolt/registry/contract/contract_state.hpp>
#include <bolt/registry/contract/storage_array.hpp>
#include <bolt/registry/contract/storage_variable.hpp>
#include <bolt/registry/registry_parameters.hpp>

#include <evmc/evmc.hpp>

#include <bit>
#include <cstdint>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

BOLT_REGISTRY_NAMESPACE_BEGIN

using namespace evmc::literals;

inline constexpr Address REGISTRY_CA =
    0x0000000000000000000000000000000000001001_address;

// largest number of registration slots scanned by one paginated query
inline constexpr uint32_t PAGINATED_RESULTS_SIZE = 100;

enum ValidatorFlags : uint8_t
{
    ValidatorExists = 0x01,
    ValidatorDeregistered = 0x02,
};

// storage layout of one registration slot
struct ValidatorInfo
{
    crypto::BlsPubkeyBytes pubkey;
    Address controller;
    Address authorized_operator;
    u64_be max_committed_gas_limit;
    u64_be sequence_number;
    uint8_t flags;
};

static_assert(sizeof(ValidatorInfo) == 105);
static_assert(alignof(ValidatorInfo) == 1);
static_assert(StorageVariable<ValidatorInfo>::N == 4);

struct Validator
{
    crypto::BlsPubkeyBytes pubkey{};
    bool exists{false};
    Address controller{};
    Address authorized_operator{};
    uint64_t max_committed_gas_limit{0};
    // 1-based registration order
    uint64_t sequence_number{0};

    friend bool operator==(Validator const &, Validator const &) = default;
};

/**
 * Root signed by a validator key to prove possession when registering it
 * for `controller`: sha256(pubkey || controller) in the registration domain.
 */
bytes32_t registration_signing_root(
    crypto::BlsPubkeyBytes const &, Address const &controller, crypto::Chain);

/**
 * On-chain registry of validator keys.
 *
 * Each BLS key is stored under the hash of its uncompressed form and moves
 * Absent -> Registered -> Deregistered. A deregistered key keeps its slot as
 * a tombstone and cannot be registered again. Only the controller that
 * registered a key may change or remove it.
 *
 * Mutating calls check every precondition before the first write, so a
 * failed call leaves storage unchanged. The ABI entry point additionally
 * runs each call inside a state checkpoint.
 */
class ValidatorRegistry
{
    ContractState &state_;
    RegistryParameters const &params_;
    crypto::Chain const chain_;
    delegation::DelegationVerifier const verifier_;

public:
    ValidatorRegistry(
        ContractState &, RegistryParameters const &, crypto::Chain);

    class Variables
    {
        ContractState &state_;

        static constexpr auto AddressValidators{
            0x0100000000000000000000000000000000000000000000000000000000000000_bytes32};

        enum Namespace : uint8_t
        {
            NSValidator = 0x02,
        };

    public:
        explicit Variables(ContractState &state)
            : state_{state}
        {
        }

        // pubkey hashes in registration order; a validator's sequence
        // number is its index plus one
        StorageArray<Address> validators{
            state_, REGISTRY_CA, AddressValidators};

        // mapping (bytes20 => ValidatorInfo)
        StorageVariable<ValidatorInfo>
        validator(Address const &pubkey_hash) noexcept
        {
            struct
            {
                uint8_t ns;
                Address pubkey_hash;
                uint8_t slots[11];
            } key{.ns = NSValidator, .pubkey_hash = pubkey_hash, .slots = {}};

            return {state_, REGISTRY_CA, std::bit_cast<bytes32_t>(key)};
        }
    } vars;

    crypto::Chain chain() const noexcept
    {
        return chain_;
    }

    ////////////////
    // Mutations  //
    ////////////////

    Result<void> register_validator(
        Address const &caller, crypto::BlsPubkeyBytes const &,
        crypto::BlsSignatureBytes const &, uint64_t max_committed_gas_limit,
        Address const &authorized_operator);

    Result<void> register_validator_unsafe(
        Address const &caller, crypto::BlsPubkeyBytes const &,
        uint64_t max_committed_gas_limit, Address const &authorized_operator);

    Result<void>
    deregister_validator(Address const &caller, crypto::BlsPubkeyBytes const &);

    Result<void> update_max_committed_gas_limit(
        Address const &caller, crypto::BlsPubkeyBytes const &,
        uint64_t max_committed_gas_limit);

    Result<void> update_authorized_operator(
        Address const &caller, crypto::BlsPubkeyBytes const &,
        Address const &authorized_operator);

    /////////////
    // Queries //
    /////////////

    // exists is false for unknown, malformed and deregistered keys
    Validator get_validator_by_pubkey(crypto::BlsPubkeyBytes const &);

    std::vector<Validator>
    get_validators_by_pubkeys(std::vector<crypto::BlsPubkeyBytes> const &);

    // Scans at most `limit` registration slots starting at `start` (0 based)
    // and returns the registered validators among them as
    // [done, next start, validators]. A zero or oversized limit scans a
    // full page of PAGINATED_RESULTS_SIZE slots.
    std::tuple<bool, uint64_t, std::vector<Validator>>
    get_all_validators(uint64_t start, uint32_t limit);

    uint64_t validator_count() noexcept
    {
        return vars.validators.length();
    }

    Result<void> verify_delegation(delegation::DelegationMessage const &) const;

private:
    /////////////
    // Events //
    /////////////

    // event ValidatorRegistered(
    //     bytes20 indexed pubkeyHash,
    //     address indexed controller,
    //     address         operator,
    //     uint64          maxCommittedGasLimit);
    void emit_validator_registered_event(
        Address const &pubkey_hash, Address const &controller,
        Address const &authorized_operator, u64_be max_committed_gas_limit);

    // event ValidatorDeregistered(
    //     bytes20 indexed pubkeyHash,
    //     address indexed controller);
    void emit_validator_deregistered_event(
        Address const &pubkey_hash, Address const &controller);

    // event AuthorizedOperatorUpdated(
    //     bytes20 indexed pubkeyHash,
    //     address         operator);
    void emit_authorized_operator_updated_event(
        Address const &pubkey_hash, Address const &authorized_operator);

    // event MaxCommittedGasLimitUpdated(
    //     bytes20 indexed pubkeyHash,
    //     uint64          maxCommittedGasLimit);
    void emit_max_committed_gas_limit_updated_event(
        Address const &pubkey_hash, u64_be max_committed_gas_limit);

    /////////////
    // Helpers //
    /////////////

    // registers after the caller specific checks have passed
    Result<void> insert_validator(
        Address const &caller, crypto::BlsPubkeyBytes const &,
        Address const &pubkey_hash, uint64_t max_committed_gas_limit,
        Address const &authorized_operator);

    // loads the slot of a registered key controlled by `caller`
    Result<std::pair<Address, ValidatorInfo>> load_controlled(
        Address const &caller, crypto::BlsPubkeyBytes const &);

    Validator to_validator(ValidatorInfo const &) const noexcept;

public:
    using PrecompileFunc = Result<byte_string> (ValidatorRegistry::*)(
        byte_string_view, Address const &);

    /////////////////
    // Precompiles //
    /////////////////

    // Runs one abi encoded call inside a checkpoint that is rejected when
    // the call fails.
    Result<byte_string> call(byte_string_view input, Address const &caller);

    static PrecompileFunc precompile_dispatch(byte_string_view &);

    Result<byte_string>
    precompile_register_validator(byte_string_view, Address const &);
    Result<byte_string>
    precompile_register_validator_unsafe(byte_string_view, Address const &);
    Result<byte_string>
    precompile_deregister_validator(byte_string_view, Address const &);
    Result<byte_string>
    precompile_update_max_committed_gas_limit(byte_string_view, Address const &);
    Result<byte_string>
    precompile_update_authorized_operator(byte_string_view, Address const &);
    Result<byte_string>
    precompile_get_validator_by_pubkey(byte_string_view, Address const &);
    Result<byte_string> precompile_fallback(byte_string_view, Address const &);
};

BOLT_REGISTRY_NAMESPACE_END
