// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <starksign/core/common/error.hpp>
#include <starksign/core/signing/signer.hpp>

// String level entry points for SDKs and bindings. Keys, signatures and Pedersen digests are rendered as 0x + 64 hex
// digits, message hashes in minimal hex.
namespace starksign::api {

struct SignatureHex {
    std::string r;
    std::string s;
};

struct KeyPairHex {
    std::string private_key;
    std::string public_key;
};

//! Domain fields as received from the caller, the revision is base-10
struct DomainRequest {
    std::string name;
    std::string version;
    std::string chain_id;
    std::string revision;
};

struct OrderRequest {
    uint64_t position_id{0};
    std::string base_asset_id;
    std::string base_amount;
    std::string quote_asset_id;
    std::string quote_amount;
    std::string fee_amount;
    std::string fee_asset_id;
    uint64_t expiration{0};
    uint64_t salt{0};
    std::string user_public_key;
    DomainRequest domain;
};

struct TransferRequest {
    uint64_t recipient_position_id{0};
    uint64_t sender_position_id{0};
    std::string amount;
    uint64_t expiration{0};
    std::string salt;
    std::string user_public_key;
    DomainRequest domain;
    std::string collateral_id;
};

struct WithdrawalRequest {
    std::string recipient;
    uint64_t position_id{0};
    std::string amount;
    uint64_t expiration{0};
    std::string salt;
    std::string user_public_key;
    DomainRequest domain;
    std::string collateral_id;
};

Result<SignatureHex> sign(const std::string& private_key, const std::string& msg_hash,
                          const SignerSettings& settings = {});

Result<std::string> pedersen_hash(const std::string& a, const std::string& b);

Result<KeyPairHex> generate_keypair_from_eth_signature(const std::string& eth_signature);

Result<std::string> get_public_key(const std::string& private_key);

Result<std::string> poseidon_hash_many(const std::vector<std::string>& elements);

Result<std::string> get_order_msg_hash(const OrderRequest& request);

Result<std::string> get_transfer_msg_hash(const TransferRequest& request);

Result<std::string> get_withdrawal_msg_hash(const WithdrawalRequest& request);

}  // namespace starksign::api
