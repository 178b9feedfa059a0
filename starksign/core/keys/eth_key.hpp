// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <intx/intx.hpp>

#include <starksign/core/common/error.hpp>
#include <starksign/core/field/field_element.hpp>

namespace starksign {

struct KeyPair {
    intx::uint256 private_key;
    FieldElement public_key;
};

//! \brief Grinds the r component (first 32 bytes) of a hex Ethereum signature into a Stark private key
//! \return kInvalidSignatureLength when fewer than 64 hex digits follow the optional 0x prefix,
//! kInvalidEncoding when the r digits are not hex
Result<intx::uint256> private_key_from_eth_signature(std::string_view signature);

//! \brief Stark public key, i.e. the x coordinate of private_key * G
Result<FieldElement> public_key_from_private_key(const intx::uint256& private_key);

Result<KeyPair> generate_keypair_from_eth_signature(std::string_view signature);

}  // namespace starksign
