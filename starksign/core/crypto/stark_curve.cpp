// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "stark_curve.hpp"

#include <string>

#include <starkware/crypto/ecdsa.h>
#include <starkware/utils/error_handling.h>

#include <starksign/core/crypto/big_int.hpp>

namespace starksign::crypto {

Result<FieldElement> generator_multiple_x(const intx::uint256& scalar, std::string_view field) {
    if (!is_valid_scalar(scalar)) {
        return make_error(ErrorCode::kValueOutOfRange, std::string{field}, "scalar not in [1, N)");
    }
    try {
        const auto point{starkware::GetPublicKey(to_stark_value(scalar))};
        return FieldElement::from_uint256(from_stark_element(point.x), field);
    } catch (const starkware::StarkException& e) {
        return make_error(ErrorCode::kValueOutOfRange, std::string{field}, e.what());
    }
}

}  // namespace starksign::crypto
