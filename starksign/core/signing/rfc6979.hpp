// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <intx/intx.hpp>

#include <starksign/core/common/error.hpp>
#include <starksign/core/field/field_element.hpp>

namespace starksign {

//! Bound on rejected HMAC-DRBG draws for a single nonce, each draw is accepted with probability close to 1/2
inline constexpr uint32_t kMaxNonceDraws{256};

//! \brief Deterministic ECDSA nonce in [1, N) following RFC 6979 with HMAC-SHA256
//! \details The private key and the message hash enter the DRBG as 32 byte big-endian strings, a non-zero seed as
//! extra data in its shortest big-endian form. Draws are shifted right by 4 bits, as the curve order has 252 bits
//! \return kInvalidNonce if no draw is accepted within kMaxNonceDraws
Result<intx::uint256> generate_k(const intx::uint256& private_key, const FieldElement& msg_hash,
                                 const intx::uint256& seed = 0);

}  // namespace starksign
