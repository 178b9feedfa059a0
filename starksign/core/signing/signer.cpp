// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "signer.hpp"

#include <string>

#include <magic_enum.hpp>

#include <starksign/core/crypto/stark_curve.hpp>
#include <starksign/core/signing/rfc6979.hpp>
#include <starksign/infra/common/log.hpp>

namespace starksign {

namespace {

    bool is_emittable(const intx::uint256& value) noexcept { return value != 0 && value < kEcdsaUpperBound; }

}  // namespace

intx::uint256 inverse_mod_order(const intx::uint256& value) noexcept {
    intx::uint256 result{1};
    intx::uint256 base{value % kCurveOrder};
    intx::uint256 exponent{kCurveOrder - 2};
    while (exponent != 0) {
        if ((exponent[0] & 1) != 0) {
            result = intx::mulmod(result, base, kCurveOrder);
        }
        base = intx::mulmod(base, base, kCurveOrder);
        exponent >>= 1;
    }
    return result;
}

Result<Signature> sign_with_nonce(const intx::uint256& private_key, const FieldElement& msg_hash,
                                  const intx::uint256& k, SignatureForm form) {
    const auto r_element{crypto::generator_multiple_x(k, "k")};
    if (!r_element) {
        return tl::unexpected{r_element.error()};
    }
    const intx::uint256& r{r_element->value()};
    if (!is_emittable(r)) {
        return make_error(ErrorCode::kInvalidNonce, "r", "r not in [1, 2^251)");
    }

    // r < 2^251 < N, msg_hash < 2^251 < N
    const auto z_plus_r_key{intx::addmod(msg_hash.value(), intx::mulmod(r, private_key, kCurveOrder), kCurveOrder)};
    if (z_plus_r_key == 0) {
        return make_error(ErrorCode::kInvalidNonce, "s", "z + r * private_key is zero mod N");
    }
    const auto s{intx::mulmod(inverse_mod_order(k), z_plus_r_key, kCurveOrder)};
    const auto emitted{form == SignatureForm::kStandard ? s : inverse_mod_order(s)};
    if (!is_emittable(emitted)) {
        return make_error(ErrorCode::kInvalidNonce, "s", "emitted component not in [1, 2^251)");
    }
    return Signature{r, emitted};
}

Result<Signature> sign(const intx::uint256& private_key, const FieldElement& msg_hash,
                       const SignerSettings& settings) {
    if (!crypto::is_valid_scalar(private_key)) {
        return make_error(ErrorCode::kValueOutOfRange, "private_key", "not in [1, N)");
    }
    if (msg_hash.value() >= kEcdsaUpperBound) {
        return make_error(ErrorCode::kValueOutOfRange, "msg_hash", "not below 2^251");
    }

    for (uint32_t attempt{0}; attempt < settings.max_attempts; ++attempt) {
        const auto k{generate_k(private_key, msg_hash, attempt)};
        if (!k) {
            return tl::unexpected{k.error()};
        }
        auto signature{sign_with_nonce(private_key, msg_hash, *k, settings.form)};
        if (signature || signature.error().code != ErrorCode::kInvalidNonce) {
            return signature;
        }
        STARKSIGN_TRACE_M("sign retrying with next seed",
                          {"seed", std::to_string(attempt), "form", std::string{magic_enum::enum_name(settings.form)},
                           "reason", signature.error().to_string()});
    }
    return make_error(ErrorCode::kInvalidNonce, "k",
                      "no usable nonce in " + std::to_string(settings.max_attempts) + " attempts");
}

}  // namespace starksign
