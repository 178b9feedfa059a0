// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <intx/intx.hpp>

#include <starksign/core/common/error.hpp>

namespace starksign {

//! Iteration ceiling of the grinding loop; each round fails with probability below 1/2
inline constexpr uint64_t kDefaultGrindIterations{uint64_t{1} << 20};

//! \brief Derives a uniformly distributed scalar in [0, N) from an arbitrary 256-bit seed
//! \details Hashes SHA-256(seed || index) for index = 0, 1, ... with both operands in their shortest big-endian form,
//! rejecting digests at or above the largest multiple of N below 2^256 so that the reduction mod N is unbiased
//! \return kKeyDerivationExhausted when max_iterations digests were all rejected
Result<intx::uint256> grind_key(const intx::uint256& seed, uint64_t max_iterations = kDefaultGrindIterations);

}  // namespace starksign
