// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "operations.hpp"

#include <catch2/catch.hpp>

namespace starksign::api {

static const DomainRequest kSepolia{"Perpetuals", "v0", "SN_SEPOLIA", "1"};

static OrderRequest sample_order() {
    return OrderRequest{
        .position_id = 100,
        .base_asset_id = "0x2",
        .base_amount = "100",
        .quote_asset_id = "0x1",
        .quote_amount = "-156",
        .fee_amount = "74",
        .fee_asset_id = "0x1",
        .expiration = 100,
        .salt = 123,
        .user_public_key = "0x5d05989e9302dcebc74e241001e3e3ac3f4402ccf2f8e6f74b034b07ad6a904",
        .domain = kSepolia,
    };
}

static TransferRequest sample_transfer() {
    return TransferRequest{
        .recipient_position_id = 1,
        .sender_position_id = 2,
        .amount = "4",
        .expiration = 5,
        .salt = "6",
        .user_public_key = "0x5d05989e9302dcebc74e241001e3e3ac3f4402ccf2f8e6f74b034b07ad6a904",
        .domain = kSepolia,
        .collateral_id = "0x3",
    };
}

static WithdrawalRequest sample_withdrawal() {
    return WithdrawalRequest{
        .recipient = "0x74f4acf13b85f07dfb677ad5ada7cd74e7fb14cec4d4990dbbc2db42453356",
        .position_id = 2,
        .amount = "1000",
        .expiration = 0,
        .salt = "0",
        .user_public_key = "0x5D05989E9302DCEBC74E241001E3E3AC3F4402CCF2F8E6F74B034B07AD6A904",
        .domain = kSepolia,
        .collateral_id = "0x310dc30767678b96a230dab5a4e42714089db844195f93fd9ae4785738b12de",
    };
}

TEST_CASE("Order message hash", "[starksign][api]") {
    auto request{sample_order()};
    const auto hash{get_order_msg_hash(request)};
    REQUIRE(hash);
    CHECK(*hash == "0x4de4c009e0d0c5a70a7da0e2039fb2b99f376d53496f89d9f437e736add6b48");
    CHECK(get_order_msg_hash(request) == hash);

    SECTION("position id above 32 bits") {
        request.position_id = uint64_t{1} << 32;
        const auto failed{get_order_msg_hash(request)};
        REQUIRE(!failed);
        CHECK(failed.error().code == ErrorCode::kValueOutOfRange);
        CHECK(failed.error().field == "position_id");
    }
    SECTION("amount is not a number") {
        request.base_amount = "1O0";
        const auto failed{get_order_msg_hash(request)};
        REQUIRE(!failed);
        CHECK(failed.error().code == ErrorCode::kInvalidEncoding);
        CHECK(failed.error().field == "base_amount");
    }
    SECTION("fee amount must be unsigned") {
        request.fee_amount = "-74";
        const auto failed{get_order_msg_hash(request)};
        REQUIRE(!failed);
        CHECK(failed.error().field == "fee_amount");
    }
    SECTION("domain name too long") {
        request.domain.name = std::string(32, 'P');
        const auto failed{get_order_msg_hash(request)};
        REQUIRE(!failed);
        CHECK(failed.error().code == ErrorCode::kStringTooLong);
        CHECK(failed.error().field == "domain_name");
    }
    SECTION("revision is not a u32") {
        request.domain.revision = "4294967296";
        const auto failed{get_order_msg_hash(request)};
        REQUIRE(!failed);
        CHECK(failed.error().code == ErrorCode::kValueOutOfRange);
        CHECK(failed.error().field == "domain_revision");
    }
    SECTION("public key above the field prime") {
        request.user_public_key = "0x800000000000011000000000000000000000000000000000000000000000001";
        const auto failed{get_order_msg_hash(request)};
        REQUIRE(!failed);
        CHECK(failed.error().code == ErrorCode::kValueOutOfRange);
        CHECK(failed.error().field == "user_public_key");
    }
}

TEST_CASE("Transfer message hash", "[starksign][api]") {
    auto request{sample_transfer()};
    const auto hash{get_transfer_msg_hash(request)};
    REQUIRE(hash);
    CHECK(*hash == "0x56c7b21d13b79a33d7700dda20e22246c25e89818249504148174f527fc3f8f");

    SECTION("salt is decimal") {
        request.salt = "0x6";
        const auto failed{get_transfer_msg_hash(request)};
        REQUIRE(!failed);
        CHECK(failed.error().code == ErrorCode::kInvalidEncoding);
        CHECK(failed.error().field == "salt");
    }
    SECTION("sender position id above 32 bits") {
        request.sender_position_id = uint64_t{1} << 40;
        const auto failed{get_transfer_msg_hash(request)};
        REQUIRE(!failed);
        CHECK(failed.error().field == "sender_position_id");
    }
}

TEST_CASE("Withdrawal message hash", "[starksign][api]") {
    auto request{sample_withdrawal()};
    const auto hash{get_withdrawal_msg_hash(request)};
    REQUIRE(hash);
    CHECK(*hash == "0x4d309315e433ca868b82a041fb63c6d79364e67f93fb067638c3428044d358a");

    SECTION("collateral id is hex") {
        request.collateral_id = "collateral";
        const auto failed{get_withdrawal_msg_hash(request)};
        REQUIRE(!failed);
        CHECK(failed.error().code == ErrorCode::kInvalidEncoding);
        CHECK(failed.error().field == "collateral_id");
    }
}

TEST_CASE("Signing a message hash", "[starksign][api]") {
    const auto signature{sign("0x3c1e9550e66958296d11b60f8e8e7a7ad990d07fa65d5f7652c4a6c87d4e3cc",
                              "0x4de4c009e0d0c5a70a7da0e2039fb2b99f376d53496f89d9f437e736add6b48")};
    REQUIRE(signature);
    CHECK(signature->r == "0x0578c5f9517ac3290b57086cbf1f60bb2e49e241b6c7f64fd34e4275bad8a96a");
    CHECK(signature->s == "0x06aa901b47f7206a0123804b159596c23471b33a5fd86b6c9be1df1022fc53df");

    const auto invalid_key{sign("0xzz", "0x1")};
    REQUIRE(!invalid_key);
    CHECK(invalid_key.error().field == "private_key");

    const auto zero_key{sign("0x0", "0x1")};
    REQUIRE(!zero_key);
    CHECK(zero_key.error().code == ErrorCode::kValueOutOfRange);
}

TEST_CASE("Key derivation operations", "[starksign][api]") {
    const auto key_pair{generate_keypair_from_eth_signature(
        "0x9ef64d5936681edf44b4a7ad713f3bc24065d4039562af03fccf6a08d6996eab367df11439169b417b6a6d8ce81d409edb022597ce19"
        "3916757c7d5d9cbf97301c")};
    REQUIRE(key_pair);
    CHECK(key_pair->private_key == "0x07dbb2c8651cc40e1d0d60b45eb52039f317a8aa82798bda52eee272136c0c44");
    CHECK(key_pair->public_key == "0x078298687996aff29a0bbcb994e1305db082d084f85ec38bb78c41e6787740ec");

    const auto public_key{get_public_key(key_pair->private_key)};
    REQUIRE(public_key);
    CHECK(*public_key == key_pair->public_key);

    const auto short_signature{generate_keypair_from_eth_signature("0x1234")};
    REQUIRE(!short_signature);
    CHECK(short_signature.error().code == ErrorCode::kInvalidSignatureLength);
}

TEST_CASE("Hash operations", "[starksign][api]") {
    const auto pedersen{pedersen_hash("0x3d937c035c878245caf64531a5756109c53068da139362728feb561405371cb",
                                      "0x208a0a10250e382e1e4bbe2880906c2791bf6275695e02fbbc6aeff9cd8b31a")};
    REQUIRE(pedersen);
    CHECK(*pedersen == "0x030e480bed5fe53fa909cc0f8c4d99b8f9f2c016be4c41e13a4848797979c662");

    const auto poseidon{poseidon_hash_many({"0x1", "0x2"})};
    REQUIRE(poseidon);
    CHECK(*poseidon == "0x0371cb6995ea5e7effcd2e174de264b5b407027a75a231a70c2c8d196107f0e7");

    const auto bad_element{poseidon_hash_many({"0x1", "nope"})};
    REQUIRE(!bad_element);
    CHECK(bad_element.error().field == "elements[1]");
}

}  // namespace starksign::api
