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

#include <bolt/core/address.hpp>
#include <bolt/core/big_endian.hpp>
#include <bolt/core/byte_string.hpp>
#include <bolt/core/bytes.hpp>
#include <bolt/core/likely.h>
#include <bolt/core/result.hpp>
#include <bolt/crypto/bls.hpp>
#include <bolt/crypto/signing.hpp>
#include <bolt/registry/config.hpp>
#include <bolt/registry/contract/abi_decode.hpp>
#include <bolt/registry/contract/abi_encode.hpp>
#include <bolt/registry/contract/abi_signatures.hpp>
#include <bolt/registry/contract/events.hpp>
#include <bolt/registry/registry_error.hpp>
#include <bolt/registry/validator_registry.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <algorithm>
#include <bit>
#include <cstdint>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

BOLT_REGISTRY_NAMESPACE_BEGIN

namespace
{
    struct PrecompileSelector
    {
        static constexpr uint32_t REGISTER_VALIDATOR =
            abi_encode_selector("registerValidator(bytes,bytes,uint64,address)");
        static constexpr uint32_t REGISTER_VALIDATOR_UNSAFE =
            abi_encode_selector("registerValidatorUnsafe(bytes,uint64,address)");
        static constexpr uint32_t DEREGISTER_VALIDATOR =
            abi_encode_selector("deregisterValidator(bytes)");
        static constexpr uint32_t UPDATE_MAX_COMMITTED_GAS_LIMIT =
            abi_encode_selector("updateMaxCommittedGasLimit(bytes,uint64)");
        static constexpr uint32_t UPDATE_AUTHORIZED_OPERATOR =
            abi_encode_selector("updateAuthorizedOperator(bytes,address)");
        static constexpr uint32_t GET_VALIDATOR_BY_PUBKEY =
            abi_encode_selector("getValidatorByPubkey(bytes)");
    };

    static_assert(PrecompileSelector::REGISTER_VALIDATOR == 0x1bbf0da0);
    static_assert(PrecompileSelector::REGISTER_VALIDATOR_UNSAFE == 0xde71af7c);
    static_assert(PrecompileSelector::DEREGISTER_VALIDATOR == 0x0371de35);
    static_assert(
        PrecompileSelector::UPDATE_MAX_COMMITTED_GAS_LIMIT == 0x7ba6e33f);
    static_assert(PrecompileSelector::UPDATE_AUTHORIZED_OPERATOR == 0x61776d58);
    static_assert(PrecompileSelector::GET_VALIDATOR_BY_PUBKEY == 0xf38a97f1);

    // pubkey hashes are bytes20 in events, left aligned in the topic
    bytes32_t abi_encode_pubkey_hash(Address const &pubkey_hash)
    {
        return abi_encode_bytes_fixed(
            std::bit_cast<byte_string_fixed<20>>(pubkey_hash));
    }

    std::optional<Address> hash_pubkey(crypto::BlsPubkeyBytes const &pubkey)
    {
        crypto::BlsPubkey const pk{pubkey};
        if (!pk.is_valid()) {
            return std::nullopt;
        }
        return crypto::pubkey_hash(pk.serialize());
    }
}

bytes32_t registration_signing_root(
    crypto::BlsPubkeyBytes const &pubkey, Address const &controller,
    crypto::Chain const chain)
{
    byte_string message;
    message += to_byte_string_view(pubkey);
    message += to_byte_string_view(controller.bytes);
    return crypto::compute_signing_root(
        crypto::sha256(message),
        crypto::compute_domain(crypto::DOMAIN_REGISTRATION, chain));
}

ValidatorRegistry::ValidatorRegistry(
    ContractState &state, RegistryParameters const &params,
    crypto::Chain const chain)
    : state_{state}
    , params_{params}
    , chain_{chain}
    , verifier_{chain}
    , vars{state}
{
}

////////////
// Events //
////////////

void ValidatorRegistry::emit_validator_registered_event(
    Address const &pubkey_hash, Address const &controller,
    Address const &authorized_operator, u64_be const max_committed_gas_limit)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "ValidatorRegistered(bytes20,address,address,uint64)");
    static_assert(
        signature ==
        0x2130de3c82365fdc1551330dc378493223f80a47c94702d7703682e225779e23_bytes32);

    auto const event = EventBuilder(REGISTRY_CA, signature)
                           .add_topic(abi_encode_pubkey_hash(pubkey_hash))
                           .add_topic(abi_encode_address(controller))
                           .add_data(abi_encode_address(authorized_operator))
                           .add_data(abi_encode_uint(max_committed_gas_limit))
                           .build();
    state_.store_log(event);
}

void ValidatorRegistry::emit_validator_deregistered_event(
    Address const &pubkey_hash, Address const &controller)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("ValidatorDeregistered(bytes20,address)");
    static_assert(
        signature ==
        0x6cecb8c8096fc1a7109a0f24de87daf3e9597dfb804401d29dab9a61a7bb898f_bytes32);

    auto const event = EventBuilder(REGISTRY_CA, signature)
                           .add_topic(abi_encode_pubkey_hash(pubkey_hash))
                           .add_topic(abi_encode_address(controller))
                           .build();
    state_.store_log(event);
}

void ValidatorRegistry::emit_authorized_operator_updated_event(
    Address const &pubkey_hash, Address const &authorized_operator)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("AuthorizedOperatorUpdated(bytes20,address)");
    static_assert(
        signature ==
        0x8a63240517af64320aba45279e0eb14dadd814e6b88c00e0e2fc3f63350f80d1_bytes32);

    auto const event = EventBuilder(REGISTRY_CA, signature)
                           .add_topic(abi_encode_pubkey_hash(pubkey_hash))
                           .add_data(abi_encode_address(authorized_operator))
                           .build();
    state_.store_log(event);
}

void ValidatorRegistry::emit_max_committed_gas_limit_updated_event(
    Address const &pubkey_hash, u64_be const max_committed_gas_limit)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "MaxCommittedGasLimitUpdated(bytes20,uint64)");
    static_assert(
        signature ==
        0x6032ca7d4352918d6cc164d9f436dfbfa8562ead5f775613780d42283c031b84_bytes32);

    auto const event = EventBuilder(REGISTRY_CA, signature)
                           .add_topic(abi_encode_pubkey_hash(pubkey_hash))
                           .add_data(abi_encode_uint(max_committed_gas_limit))
                           .build();
    state_.store_log(event);
}

///////////////
// Mutations //
///////////////

Result<void> ValidatorRegistry::register_validator(
    Address const &caller, crypto::BlsPubkeyBytes const &pubkey,
    crypto::BlsSignatureBytes const &signature,
    uint64_t const max_committed_gas_limit,
    Address const &authorized_operator)
{
    crypto::BlsPubkey const pk{pubkey};
    crypto::BlsSignature const sig{signature};
    if (BOLT_UNLIKELY(!pk.is_valid() || !sig.is_valid())) {
        return RegistryError::MalformedPoint;
    }
    if (BOLT_UNLIKELY(authorized_operator == Address{})) {
        return RegistryError::InvalidAuthorizedOperator;
    }
    auto const pubkey_hash = crypto::pubkey_hash(pk.serialize());
    if (BOLT_UNLIKELY(vars.validator(pubkey_hash).load_checked().has_value())) {
        return RegistryError::ValidatorAlreadyExists;
    }
    auto const root = registration_signing_root(pubkey, caller, chain_);
    if (BOLT_UNLIKELY(!sig.verify(pk, to_byte_string_view(root)))) {
        return RegistryError::BadSignature;
    }
    return insert_validator(
        caller,
        pubkey,
        pubkey_hash,
        max_committed_gas_limit,
        authorized_operator);
}

Result<void> ValidatorRegistry::register_validator_unsafe(
    Address const &caller, crypto::BlsPubkeyBytes const &pubkey,
    uint64_t const max_committed_gas_limit,
    Address const &authorized_operator)
{
    if (BOLT_UNLIKELY(!params_.allow_unsafe_registration())) {
        return RegistryError::UnsafeRegistrationNotAllowed;
    }
    auto const pubkey_hash = hash_pubkey(pubkey);
    if (BOLT_UNLIKELY(!pubkey_hash.has_value())) {
        return RegistryError::MalformedPoint;
    }
    if (BOLT_UNLIKELY(authorized_operator == Address{})) {
        return RegistryError::InvalidAuthorizedOperator;
    }
    if (BOLT_UNLIKELY(
            vars.validator(*pubkey_hash).load_checked().has_value())) {
        return RegistryError::ValidatorAlreadyExists;
    }
    return insert_validator(
        caller,
        pubkey,
        *pubkey_hash,
        max_committed_gas_limit,
        authorized_operator);
}

Result<void> ValidatorRegistry::insert_validator(
    Address const &caller, crypto::BlsPubkeyBytes const &pubkey,
    Address const &pubkey_hash, uint64_t const max_committed_gas_limit,
    Address const &authorized_operator)
{
    vars.validators.push(pubkey_hash);
    u64_be const sequence_number = vars.validators.length();
    vars.validator(pubkey_hash)
        .store(ValidatorInfo{
            .pubkey = pubkey,
            .controller = caller,
            .authorized_operator = authorized_operator,
            .max_committed_gas_limit = max_committed_gas_limit,
            .sequence_number = sequence_number,
            .flags = ValidatorExists});

    emit_validator_registered_event(
        pubkey_hash, caller, authorized_operator, max_committed_gas_limit);
    return outcome::success();
}

Result<std::pair<Address, ValidatorInfo>> ValidatorRegistry::load_controlled(
    Address const &caller, crypto::BlsPubkeyBytes const &pubkey)
{
    auto const pubkey_hash = hash_pubkey(pubkey);
    if (BOLT_UNLIKELY(!pubkey_hash.has_value())) {
        return RegistryError::NotRegisteredValidator;
    }
    auto const info = vars.validator(*pubkey_hash).load();
    if (BOLT_UNLIKELY(!(info.flags & ValidatorExists))) {
        return RegistryError::NotRegisteredValidator;
    }
    if (BOLT_UNLIKELY(info.controller != caller)) {
        return RegistryError::UnauthorizedCaller;
    }
    return std::make_pair(*pubkey_hash, info);
}

Result<void> ValidatorRegistry::deregister_validator(
    Address const &caller, crypto::BlsPubkeyBytes const &pubkey)
{
    BOOST_OUTCOME_TRY(auto const loaded, load_controlled(caller, pubkey));
    auto const &[pubkey_hash, info] = loaded;

    // the slot stays behind as a tombstone
    vars.validator(pubkey_hash)
        .store(ValidatorInfo{
            .pubkey = info.pubkey,
            .controller = {},
            .authorized_operator = {},
            .max_committed_gas_limit = {},
            .sequence_number = info.sequence_number,
            .flags = ValidatorDeregistered});

    emit_validator_deregistered_event(pubkey_hash, info.controller);
    return outcome::success();
}

Result<void> ValidatorRegistry::update_max_committed_gas_limit(
    Address const &caller, crypto::BlsPubkeyBytes const &pubkey,
    uint64_t const max_committed_gas_limit)
{
    BOOST_OUTCOME_TRY(auto loaded, load_controlled(caller, pubkey));
    auto &[pubkey_hash, info] = loaded;

    info.max_committed_gas_limit = max_committed_gas_limit;
    vars.validator(pubkey_hash).store(info);

    emit_max_committed_gas_limit_updated_event(
        pubkey_hash, info.max_committed_gas_limit);
    return outcome::success();
}

Result<void> ValidatorRegistry::update_authorized_operator(
    Address const &caller, crypto::BlsPubkeyBytes const &pubkey,
    Address const &authorized_operator)
{
    BOOST_OUTCOME_TRY(auto loaded, load_controlled(caller, pubkey));
    if (BOLT_UNLIKELY(authorized_operator == Address{})) {
        return RegistryError::InvalidAuthorizedOperator;
    }
    auto &[pubkey_hash, info] = loaded;

    info.authorized_operator = authorized_operator;
    vars.validator(pubkey_hash).store(info);

    emit_authorized_operator_updated_event(pubkey_hash, authorized_operator);
    return outcome::success();
}

/////////////
// Queries //
/////////////

Validator
ValidatorRegistry::to_validator(ValidatorInfo const &info) const noexcept
{
    if (!(info.flags & ValidatorExists)) {
        return Validator{.pubkey = info.pubkey};
    }
    return Validator{
        .pubkey = info.pubkey,
        .exists = true,
        .controller = info.controller,
        .authorized_operator = info.authorized_operator,
        .max_committed_gas_limit = info.max_committed_gas_limit.native(),
        .sequence_number = info.sequence_number.native()};
}

Validator
ValidatorRegistry::get_validator_by_pubkey(crypto::BlsPubkeyBytes const &pubkey)
{
    auto const pubkey_hash = hash_pubkey(pubkey);
    if (!pubkey_hash.has_value()) {
        return Validator{.pubkey = pubkey};
    }
    auto validator = to_validator(vars.validator(*pubkey_hash).load());
    validator.pubkey = pubkey;
    return validator;
}

std::vector<Validator> ValidatorRegistry::get_validators_by_pubkeys(
    std::vector<crypto::BlsPubkeyBytes> const &pubkeys)
{
    std::vector<Validator> validators;
    validators.reserve(pubkeys.size());
    for (auto const &pubkey : pubkeys) {
        validators.push_back(get_validator_by_pubkey(pubkey));
    }
    return validators;
}

std::tuple<bool, uint64_t, std::vector<Validator>>
ValidatorRegistry::get_all_validators(uint64_t const start, uint32_t limit)
{
    // zero asks for the default page
    if (limit == 0 || limit > PAGINATED_RESULTS_SIZE) {
        limit = PAGINATED_RESULTS_SIZE;
    }

    auto const length = vars.validators.length();
    auto const end = start >= length ? length : start + std::min<uint64_t>(
                                                            limit,
                                                            length - start);

    std::vector<Validator> validators;
    for (uint64_t i = start; i < end; ++i) {
        auto const pubkey_hash = vars.validators.get(i).load();
        auto validator = to_validator(vars.validator(pubkey_hash).load());
        if (validator.exists) {
            validators.push_back(validator);
        }
    }
    return {end == length, end, std::move(validators)};
}

Result<void> ValidatorRegistry::verify_delegation(
    delegation::DelegationMessage const &message) const
{
    return verifier_.verify(message);
}

/////////////////
// Precompiles //
/////////////////

Result<byte_string>
ValidatorRegistry::call(byte_string_view input, Address const &caller)
{
    auto const method = precompile_dispatch(input);

    state_.push();
    auto result = (this->*method)(input, caller);
    if (result.has_error()) {
        state_.pop_reject();
    }
    else {
        state_.pop_accept();
    }
    return result;
}

ValidatorRegistry::PrecompileFunc
ValidatorRegistry::precompile_dispatch(byte_string_view &input)
{
    if (BOLT_UNLIKELY(input.size() < 4)) {
        return &ValidatorRegistry::precompile_fallback;
    }

    auto const signature =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
    input.remove_prefix(4);

    switch (signature) {
    case PrecompileSelector::REGISTER_VALIDATOR:
        return &ValidatorRegistry::precompile_register_validator;
    case PrecompileSelector::REGISTER_VALIDATOR_UNSAFE:
        return &ValidatorRegistry::precompile_register_validator_unsafe;
    case PrecompileSelector::DEREGISTER_VALIDATOR:
        return &ValidatorRegistry::precompile_deregister_validator;
    case PrecompileSelector::UPDATE_MAX_COMMITTED_GAS_LIMIT:
        return &ValidatorRegistry::precompile_update_max_committed_gas_limit;
    case PrecompileSelector::UPDATE_AUTHORIZED_OPERATOR:
        return &ValidatorRegistry::precompile_update_authorized_operator;
    case PrecompileSelector::GET_VALIDATOR_BY_PUBKEY:
        return &ValidatorRegistry::precompile_get_validator_by_pubkey;
    default:
        return &ValidatorRegistry::precompile_fallback;
    }
}

Result<byte_string> ValidatorRegistry::precompile_register_validator(
    byte_string_view input, Address const &caller)
{
    BOOST_OUTCOME_TRY(abi_decode_fixed<u256_be>(input)); // pubkey offset
    BOOST_OUTCOME_TRY(abi_decode_fixed<u256_be>(input)); // signature offset
    BOOST_OUTCOME_TRY(auto const gas_limit, abi_decode_fixed<u64_be>(input));
    BOOST_OUTCOME_TRY(auto const op, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(
        auto const pubkey,
        abi_decode_bytes_tail<crypto::BLS_PUBKEY_SIZE>(input));
    BOOST_OUTCOME_TRY(
        auto const signature,
        abi_decode_bytes_tail<crypto::BLS_SIGNATURE_SIZE>(input));
    if (BOLT_UNLIKELY(!input.empty())) {
        return RegistryError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(register_validator(
        caller, pubkey, signature, gas_limit.native(), op));
    return byte_string{};
}

Result<byte_string> ValidatorRegistry::precompile_register_validator_unsafe(
    byte_string_view input, Address const &caller)
{
    BOOST_OUTCOME_TRY(abi_decode_fixed<u256_be>(input)); // pubkey offset
    BOOST_OUTCOME_TRY(auto const gas_limit, abi_decode_fixed<u64_be>(input));
    BOOST_OUTCOME_TRY(auto const op, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(
        auto const pubkey,
        abi_decode_bytes_tail<crypto::BLS_PUBKEY_SIZE>(input));
    if (BOLT_UNLIKELY(!input.empty())) {
        return RegistryError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(
        register_validator_unsafe(caller, pubkey, gas_limit.native(), op));
    return byte_string{};
}

Result<byte_string> ValidatorRegistry::precompile_deregister_validator(
    byte_string_view input, Address const &caller)
{
    BOOST_OUTCOME_TRY(abi_decode_fixed<u256_be>(input)); // pubkey offset
    BOOST_OUTCOME_TRY(
        auto const pubkey,
        abi_decode_bytes_tail<crypto::BLS_PUBKEY_SIZE>(input));
    if (BOLT_UNLIKELY(!input.empty())) {
        return RegistryError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(deregister_validator(caller, pubkey));
    return byte_string{};
}

Result<byte_string>
ValidatorRegistry::precompile_update_max_committed_gas_limit(
    byte_string_view input, Address const &caller)
{
    BOOST_OUTCOME_TRY(abi_decode_fixed<u256_be>(input)); // pubkey offset
    BOOST_OUTCOME_TRY(auto const gas_limit, abi_decode_fixed<u64_be>(input));
    BOOST_OUTCOME_TRY(
        auto const pubkey,
        abi_decode_bytes_tail<crypto::BLS_PUBKEY_SIZE>(input));
    if (BOLT_UNLIKELY(!input.empty())) {
        return RegistryError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(
        update_max_committed_gas_limit(caller, pubkey, gas_limit.native()));
    return byte_string{};
}

Result<byte_string> ValidatorRegistry::precompile_update_authorized_operator(
    byte_string_view input, Address const &caller)
{
    BOOST_OUTCOME_TRY(abi_decode_fixed<u256_be>(input)); // pubkey offset
    BOOST_OUTCOME_TRY(auto const op, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(
        auto const pubkey,
        abi_decode_bytes_tail<crypto::BLS_PUBKEY_SIZE>(input));
    if (BOLT_UNLIKELY(!input.empty())) {
        return RegistryError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(update_authorized_operator(caller, pubkey, op));
    return byte_string{};
}

// returns (bytes pubkey, bool exists, address controller,
//          address authorizedOperator, uint64 maxCommittedGasLimit,
//          uint64 sequenceNumber)
Result<byte_string> ValidatorRegistry::precompile_get_validator_by_pubkey(
    byte_string_view input, Address const &)
{
    BOOST_OUTCOME_TRY(abi_decode_fixed<u256_be>(input)); // pubkey offset
    BOOST_OUTCOME_TRY(
        auto const pubkey,
        abi_decode_bytes_tail<crypto::BLS_PUBKEY_SIZE>(input));
    if (BOLT_UNLIKELY(!input.empty())) {
        return RegistryError::InvalidInput;
    }

    auto const validator = get_validator_by_pubkey(pubkey);

    AbiEncoder encoder;
    encoder.add_bytes(to_byte_string_view(validator.pubkey));
    encoder.add_bool(validator.exists);
    encoder.add_address(validator.controller);
    encoder.add_address(validator.authorized_operator);
    encoder.add_uint(u64_be{validator.max_committed_gas_limit});
    encoder.add_uint(u64_be{validator.sequence_number});
    return encoder.encode_final();
}

Result<byte_string>
ValidatorRegistry::precompile_fallback(byte_string_view, Address const &)
{
    return RegistryError::MethodNotSupported;
}

BOLT_REGISTRY_NAMESPACE_END
