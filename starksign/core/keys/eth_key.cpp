// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "eth_key.hpp"

#include <string>

#include <starksign/core/common/util.hpp>
#include <starksign/core/crypto/stark_curve.hpp>
#include <starksign/core/field/codec.hpp>
#include <starksign/core/keys/grind_key.hpp>

namespace starksign {

namespace {

    // Hex digits of the r component
    constexpr size_t kSignatureRLength{2 * kWordLength};

}  // namespace

Result<intx::uint256> private_key_from_eth_signature(std::string_view signature) {
    const std::string_view digits{strip_hex_prefix(signature)};
    if (digits.size() < kSignatureRLength) {
        return make_error(ErrorCode::kInvalidSignatureLength, "eth_signature",
                          std::to_string(digits.size()) + " hex digits, at least " +
                              std::to_string(kSignatureRLength) + " expected");
    }
    return parse_uint256_hex(digits.substr(0, kSignatureRLength), "eth_signature")
        .and_then([](const intx::uint256& r) { return grind_key(r); });
}

Result<FieldElement> public_key_from_private_key(const intx::uint256& private_key) {
    return crypto::generator_multiple_x(private_key, "private_key");
}

Result<KeyPair> generate_keypair_from_eth_signature(std::string_view signature) {
    const auto private_key{private_key_from_eth_signature(signature)};
    if (!private_key) {
        return tl::unexpected{private_key.error()};
    }
    return public_key_from_private_key(*private_key).map([&](const FieldElement& public_key) {
        return KeyPair{*private_key, public_key};
    });
}

}  // namespace starksign
