// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include <starksign/api/operations.hpp>
#include <starksign/infra/cli/common.hpp>
#include <starksign/infra/cli/report.hpp>
#include <starksign/infra/common/log.hpp>

using namespace starksign;
using starksign::cmd::common::report;

namespace {

int print_line(const Result<std::string>& result) {
    return report(result, [](const std::string& value) { std::cout << value << "\n"; });
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app_main("Starksign: StarkEx hashing and signing tool");
    app_main.get_formatter()->column_width(50);
    app_main.require_subcommand(1);

    log::Settings log_settings{};
    cmd::common::add_logging_options(app_main, log_settings);

    // sign
    std::string sign_private_key, sign_msg_hash;
    SignerSettings signer_settings{};
    auto cmd_sign = app_main.add_subcommand("sign", "Sign a message hash");
    cmd_sign->add_option("--private-key", sign_private_key, "Stark private key (hex)")->required();
    cmd_sign->add_option("--hash", sign_msg_hash, "Message hash (hex)")->required();
    cmd_sign->add_option("--attempts", signer_settings.max_attempts, "Retry seeds tried before giving up")
        ->capture_default_str()
        ->check(CLI::Range(1u, 1024u));
    cmd::common::add_signature_form_option(*cmd_sign, signer_settings);

    // pedersen
    std::string pedersen_a, pedersen_b;
    auto cmd_pedersen = app_main.add_subcommand("pedersen", "Pedersen hash of two field elements");
    cmd_pedersen->add_option("a", pedersen_a, "First element (hex)")->required();
    cmd_pedersen->add_option("b", pedersen_b, "Second element (hex)")->required();

    // poseidon
    std::vector<std::string> poseidon_elements;
    auto cmd_poseidon = app_main.add_subcommand("poseidon", "Poseidon hash of a list of field elements");
    cmd_poseidon->add_option("elements", poseidon_elements, "Elements (hex)");

    // keypair
    std::string eth_signature;
    auto cmd_keypair = app_main.add_subcommand("keypair", "Derive a Stark key pair from an Ethereum signature");
    cmd_keypair->add_option("--eth-signature", eth_signature, "Ethereum signature (hex)")->required();

    // public-key
    std::string public_key_private_key;
    auto cmd_public_key = app_main.add_subcommand("public-key", "Stark public key of a private key");
    cmd_public_key->add_option("--private-key", public_key_private_key, "Stark private key (hex)")->required();

    // order-hash
    api::OrderRequest order;
    auto cmd_order = app_main.add_subcommand("order-hash", "Message hash of a perpetual order");
    cmd_order->add_option("--position-id", order.position_id, "Position id")->required();
    cmd_order->add_option("--base-asset-id", order.base_asset_id, "Synthetic asset id (hex)")->required();
    cmd_order->add_option("--base-amount", order.base_amount, "Signed synthetic amount (base 10)")->required();
    cmd_order->add_option("--quote-asset-id", order.quote_asset_id, "Collateral asset id (hex)")->required();
    cmd_order->add_option("--quote-amount", order.quote_amount, "Signed collateral amount (base 10)")->required();
    cmd_order->add_option("--fee-asset-id", order.fee_asset_id, "Fee asset id (hex)")->required();
    cmd_order->add_option("--fee-amount", order.fee_amount, "Fee amount (base 10)")->required();
    cmd_order->add_option("--expiration", order.expiration, "Settlement expiration in seconds")->required();
    cmd_order->add_option("--salt", order.salt, "Order nonce")->required();
    cmd_order->add_option("--public-key", order.user_public_key, "User Stark public key (hex)")->required();
    cmd::common::add_domain_options(*cmd_order, order.domain);

    // transfer-hash
    api::TransferRequest transfer;
    auto cmd_transfer = app_main.add_subcommand("transfer-hash", "Message hash of a collateral transfer");
    cmd_transfer->add_option("--recipient-position-id", transfer.recipient_position_id, "Receiving position id")
        ->required();
    cmd_transfer->add_option("--sender-position-id", transfer.sender_position_id, "Sending position id")->required();
    cmd_transfer->add_option("--collateral-id", transfer.collateral_id, "Collateral asset id (hex)")->required();
    cmd_transfer->add_option("--amount", transfer.amount, "Amount (base 10)")->required();
    cmd_transfer->add_option("--expiration", transfer.expiration, "Expiration in seconds")->required();
    cmd_transfer->add_option("--salt", transfer.salt, "Nonce (base 10)")->required();
    cmd_transfer->add_option("--public-key", transfer.user_public_key, "User Stark public key (hex)")->required();
    cmd::common::add_domain_options(*cmd_transfer, transfer.domain);

    // withdrawal-hash
    api::WithdrawalRequest withdrawal;
    auto cmd_withdrawal = app_main.add_subcommand("withdrawal-hash", "Message hash of a withdrawal");
    cmd_withdrawal->add_option("--recipient", withdrawal.recipient, "Recipient address (hex)")->required();
    cmd_withdrawal->add_option("--position-id", withdrawal.position_id, "Position id")->required();
    cmd_withdrawal->add_option("--collateral-id", withdrawal.collateral_id, "Collateral asset id (hex)")->required();
    cmd_withdrawal->add_option("--amount", withdrawal.amount, "Amount (base 10)")->required();
    cmd_withdrawal->add_option("--expiration", withdrawal.expiration, "Expiration in seconds")->required();
    cmd_withdrawal->add_option("--salt", withdrawal.salt, "Nonce (base 10)")->required();
    cmd_withdrawal->add_option("--public-key", withdrawal.user_public_key, "User Stark public key (hex)")->required();
    cmd::common::add_domain_options(*cmd_withdrawal, withdrawal.domain);

    CLI11_PARSE(app_main, argc, argv)

    try {
        log::init(log_settings);

        if (*cmd_sign) {
            return report(api::sign(sign_private_key, sign_msg_hash, signer_settings),
                          [](const api::SignatureHex& signature) {
                              std::cout << signature.r << "\n" << signature.s << "\n";
                          });
        }
        if (*cmd_pedersen) {
            return print_line(api::pedersen_hash(pedersen_a, pedersen_b));
        }
        if (*cmd_poseidon) {
            return print_line(api::poseidon_hash_many(poseidon_elements));
        }
        if (*cmd_keypair) {
            return report(api::generate_keypair_from_eth_signature(eth_signature), [](const api::KeyPairHex& key_pair) {
                std::cout << key_pair.private_key << "\n" << key_pair.public_key << "\n";
            });
        }
        if (*cmd_public_key) {
            return print_line(api::get_public_key(public_key_private_key));
        }
        if (*cmd_order) {
            log::Debug("Hashing order", {"position_id", std::to_string(order.position_id), "chain_id",
                                         order.domain.chain_id});
            return print_line(api::get_order_msg_hash(order));
        }
        if (*cmd_transfer) {
            log::Debug("Hashing transfer", {"chain_id", transfer.domain.chain_id});
            return print_line(api::get_transfer_msg_hash(transfer));
        }
        if (*cmd_withdrawal) {
            log::Debug("Hashing withdrawal", {"chain_id", withdrawal.domain.chain_id});
            return print_line(api::get_withdrawal_msg_hash(withdrawal));
        }
        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "\nError: " << ex.what() << "\n\n";
    }

    return -1;
}
