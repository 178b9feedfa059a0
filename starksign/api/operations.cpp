// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "operations.hpp"

#include <starksign/core/crypto/pedersen.hpp>
#include <starksign/core/crypto/poseidon.hpp>
#include <starksign/core/field/codec.hpp>
#include <starksign/core/keys/eth_key.hpp>
#include <starksign/core/typed_data/domain.hpp>
#include <starksign/core/typed_data/messages.hpp>

namespace starksign::api {

namespace {

    Result<StarknetDomain> parse_domain(const DomainRequest& request) {
        return parse_u32(request.revision, "domain_revision").map([&](uint32_t revision) {
            return StarknetDomain{request.name, request.version, request.chain_id, revision};
        });
    }

    Result<std::string> finish_message(const DomainRequest& domain_request, const std::string& user_public_key,
                                       const FieldElement& struct_hash) {
        const auto public_key{parse_hex(user_public_key, "user_public_key")};
        if (!public_key) return tl::unexpected{public_key.error()};
        const auto domain{parse_domain(domain_request)};
        if (!domain) return tl::unexpected{domain.error()};

        return message_hash(*domain, *public_key, struct_hash).map([](const FieldElement& hash) {
            return to_minimal_hex(hash);
        });
    }

}  // namespace

Result<SignatureHex> sign(const std::string& private_key, const std::string& msg_hash,
                          const SignerSettings& settings) {
    const auto key{parse_uint256_hex(private_key, "private_key")};
    if (!key) return tl::unexpected{key.error()};
    const auto hash{parse_hex(msg_hash, "msg_hash")};
    if (!hash) return tl::unexpected{hash.error()};

    return starksign::sign(*key, *hash, settings).map([](const Signature& signature) {
        return SignatureHex{to_fixed_hex(signature.r), to_fixed_hex(signature.s)};
    });
}

Result<std::string> pedersen_hash(const std::string& a, const std::string& b) {
    const auto lhs{parse_hex(a, "a")};
    if (!lhs) return tl::unexpected{lhs.error()};
    const auto rhs{parse_hex(b, "b")};
    if (!rhs) return tl::unexpected{rhs.error()};

    return crypto::pedersen_hash(*lhs, *rhs).map([](const FieldElement& hash) { return to_fixed_hex(hash); });
}

Result<KeyPairHex> generate_keypair_from_eth_signature(const std::string& eth_signature) {
    return starksign::generate_keypair_from_eth_signature(eth_signature).map([](const KeyPair& key_pair) {
        return KeyPairHex{to_fixed_hex(key_pair.private_key), to_fixed_hex(key_pair.public_key)};
    });
}

Result<std::string> get_public_key(const std::string& private_key) {
    return parse_uint256_hex(private_key, "private_key")
        .and_then([](const intx::uint256& key) { return public_key_from_private_key(key); })
        .map([](const FieldElement& public_key) { return to_fixed_hex(public_key); });
}

Result<std::string> poseidon_hash_many(const std::vector<std::string>& elements) {
    std::vector<FieldElement> inputs;
    inputs.reserve(elements.size());
    for (size_t i{0}; i < elements.size(); ++i) {
        const auto element{parse_hex(elements[i], "elements[" + std::to_string(i) + "]")};
        if (!element) return tl::unexpected{element.error()};
        inputs.push_back(*element);
    }
    return to_fixed_hex(crypto::poseidon_hash_many(inputs));
}

Result<std::string> get_order_msg_hash(const OrderRequest& request) {
    const auto position_id{narrow_u32(request.position_id, "position_id")};
    if (!position_id) return tl::unexpected{position_id.error()};
    const auto base_asset_id{parse_hex(request.base_asset_id, "base_asset_id")};
    if (!base_asset_id) return tl::unexpected{base_asset_id.error()};
    const auto base_amount{parse_i64(request.base_amount, "base_amount")};
    if (!base_amount) return tl::unexpected{base_amount.error()};
    const auto quote_asset_id{parse_hex(request.quote_asset_id, "quote_asset_id")};
    if (!quote_asset_id) return tl::unexpected{quote_asset_id.error()};
    const auto quote_amount{parse_i64(request.quote_amount, "quote_amount")};
    if (!quote_amount) return tl::unexpected{quote_amount.error()};
    const auto fee_asset_id{parse_hex(request.fee_asset_id, "fee_asset_id")};
    if (!fee_asset_id) return tl::unexpected{fee_asset_id.error()};
    const auto fee_amount{parse_u64(request.fee_amount, "fee_amount")};
    if (!fee_amount) return tl::unexpected{fee_amount.error()};

    const Order order{
        .position_id = *position_id,
        .base_asset_id = *base_asset_id,
        .base_amount = *base_amount,
        .quote_asset_id = *quote_asset_id,
        .quote_amount = *quote_amount,
        .fee_asset_id = *fee_asset_id,
        .fee_amount = *fee_amount,
        .expiration = request.expiration,
        .salt = request.salt,
    };
    return finish_message(request.domain, request.user_public_key, order_hash(order));
}

Result<std::string> get_transfer_msg_hash(const TransferRequest& request) {
    const auto recipient_position_id{narrow_u32(request.recipient_position_id, "recipient_position_id")};
    if (!recipient_position_id) return tl::unexpected{recipient_position_id.error()};
    const auto sender_position_id{narrow_u32(request.sender_position_id, "sender_position_id")};
    if (!sender_position_id) return tl::unexpected{sender_position_id.error()};
    const auto amount{parse_u64(request.amount, "amount")};
    if (!amount) return tl::unexpected{amount.error()};
    const auto salt{parse_decimal(request.salt, "salt")};
    if (!salt) return tl::unexpected{salt.error()};
    const auto collateral_id{parse_hex(request.collateral_id, "collateral_id")};
    if (!collateral_id) return tl::unexpected{collateral_id.error()};

    const Transfer transfer{
        .recipient_position_id = *recipient_position_id,
        .sender_position_id = *sender_position_id,
        .collateral_asset_id = *collateral_id,
        .amount = *amount,
        .expiration = request.expiration,
        .salt = *salt,
    };
    return finish_message(request.domain, request.user_public_key, transfer_hash(transfer));
}

Result<std::string> get_withdrawal_msg_hash(const WithdrawalRequest& request) {
    const auto recipient{parse_hex(request.recipient, "recipient")};
    if (!recipient) return tl::unexpected{recipient.error()};
    const auto position_id{narrow_u32(request.position_id, "position_id")};
    if (!position_id) return tl::unexpected{position_id.error()};
    const auto amount{parse_u64(request.amount, "amount")};
    if (!amount) return tl::unexpected{amount.error()};
    const auto salt{parse_decimal(request.salt, "salt")};
    if (!salt) return tl::unexpected{salt.error()};
    const auto collateral_id{parse_hex(request.collateral_id, "collateral_id")};
    if (!collateral_id) return tl::unexpected{collateral_id.error()};

    const Withdrawal withdrawal{
        .recipient = *recipient,
        .position_id = *position_id,
        .collateral_asset_id = *collateral_id,
        .amount = *amount,
        .expiration = request.expiration,
        .salt = *salt,
    };
    return finish_message(request.domain, request.user_public_key, withdrawal_hash(withdrawal));
}

}  // namespace starksign::api
