// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>

#include <intx/intx.hpp>

#include <starkware/algebra/prime_field_element.h>

namespace starksign::crypto {

using StarkValue = starkware::PrimeFieldElement::ValueType;

// Both representations keep four 64-bit limbs, least significant first
inline StarkValue to_stark_value(const intx::uint256& value) {
    return StarkValue{std::array<uint64_t, 4>{value[0], value[1], value[2], value[3]}};
}

inline intx::uint256 from_stark_value(const StarkValue& value) {
    return intx::uint256{value[0], value[1], value[2], value[3]};
}

inline starkware::PrimeFieldElement to_stark_element(const intx::uint256& value) {
    return starkware::PrimeFieldElement::FromBigInt(to_stark_value(value));
}

inline intx::uint256 from_stark_element(const starkware::PrimeFieldElement& element) {
    return from_stark_value(element.ToStandardForm());
}

}  // namespace starksign::crypto
