// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "grind_key.hpp"

#include <string>

#include <starksign/core/crypto/sha256.hpp>
#include <starksign/core/field/codec.hpp>
#include <starksign/core/field/constants.hpp>
#include <starksign/infra/common/log.hpp>

namespace starksign {

namespace {

    //! 2^256 - (2^256 mod N), computed in 256 bits using 2^256 mod N == (2^256 - N) mod N
    const intx::uint256 kGrindBound{intx::uint256{0} - ((intx::uint256{0} - kCurveOrder) % kCurveOrder)};

}  // namespace

Result<intx::uint256> grind_key(const intx::uint256& seed, uint64_t max_iterations) {
    const Bytes seed_bytes{to_minimal_bytes(seed)};
    for (uint64_t index{0}; index < max_iterations; ++index) {
        Bytes input{seed_bytes};
        input.append(to_minimal_bytes(index));
        const Bytes32 digest{crypto::sha256(input)};
        const auto candidate{intx::be::unsafe::load<intx::uint256>(digest.data())};
        if (candidate < kGrindBound) {
            return candidate % kCurveOrder;
        }
        STARKSIGN_TRACE_M("grind_key rejected digest", {"index", std::to_string(index)});
    }
    return make_error(ErrorCode::kKeyDerivationExhausted, "seed",
                      "no digest accepted in " + std::to_string(max_iterations) + " iterations");
}

}  // namespace starksign
