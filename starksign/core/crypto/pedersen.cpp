// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "pedersen.hpp"

#include <starkware/crypto/pedersen_hash.h>
#include <starkware/utils/error_handling.h>

#include <starksign/core/crypto/big_int.hpp>

namespace starksign::crypto {

Result<FieldElement> pedersen_hash(const FieldElement& a, const FieldElement& b) {
    try {
        const auto hash{starkware::PedersenHash(to_stark_element(a.value()), to_stark_element(b.value()))};
        return FieldElement::from_uint256(from_stark_element(hash), "pedersen");
    } catch (const starkware::StarkException& e) {
        return make_error(ErrorCode::kValueOutOfRange, "pedersen", e.what());
    }
}

}  // namespace starksign::crypto
