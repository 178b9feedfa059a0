// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "poseidon.hpp"

#include <string>

#include <starksign/core/common/bytes_to_string.hpp>
#include <starksign/core/crypto/sha256.hpp>

namespace starksign::crypto {

namespace {

    constexpr size_t kRounds{kPoseidonFullRounds + kPoseidonPartialRounds};

    using RoundKeys = std::array<PoseidonState, kRounds>;

    //! Round constant i is sha256("Hades" || decimal(i)) mod P, enumerated row by row
    RoundKeys build_round_keys() {
        RoundKeys keys{};
        for (size_t round{0}; round < kRounds; ++round) {
            for (size_t j{0}; j < kPoseidonWidth; ++j) {
                const std::string seed{"Hades" + std::to_string(round * kPoseidonWidth + j)};
                const Bytes32 digest{sha256(string_view_to_byte_view(seed))};
                keys[round][j] = FieldElement::reduce(intx::be::unsafe::load<intx::uint256>(digest.data()));
            }
        }
        return keys;
    }

    const RoundKeys& round_keys() {
        static const RoundKeys kRoundKeys{build_round_keys()};
        return kRoundKeys;
    }

    //! MDS matrix [[3, 1, 1], [1, -1, 1], [1, 1, -2]]
    void mix(PoseidonState& state) noexcept {
        const FieldElement sum{state[0] + state[1] + state[2]};
        const FieldElement t0{sum + state[0] + state[0]};
        const FieldElement t1{sum - state[1] - state[1]};
        const FieldElement t2{sum - state[2] - state[2] - state[2]};
        state = {t0, t1, t2};
    }

}  // namespace

void poseidon_permute(PoseidonState& state) {
    constexpr size_t kHalfFullRounds{kPoseidonFullRounds / 2};
    const RoundKeys& keys{round_keys()};
    for (size_t round{0}; round < kRounds; ++round) {
        for (size_t j{0}; j < kPoseidonWidth; ++j) {
            state[j] += keys[round][j];
        }
        const bool full_round{round < kHalfFullRounds || round >= kHalfFullRounds + kPoseidonPartialRounds};
        if (full_round) {
            for (auto& element : state) {
                element = element.cube();
            }
        } else {
            state[2] = state[2].cube();
        }
        mix(state);
    }
}

void PoseidonHasher::update(const FieldElement& element) {
    if (!pending_) {
        pending_ = element;
        return;
    }
    state_[0] += *pending_;
    state_[1] += element;
    poseidon_permute(state_);
    pending_.reset();
}

FieldElement PoseidonHasher::finalize() const {
    PoseidonState state{state_};
    if (pending_) {
        state[0] += *pending_;
        state[1] += FieldElement::from_u64(1);
    } else {
        state[0] += FieldElement::from_u64(1);
    }
    poseidon_permute(state);
    return state[0];
}

FieldElement poseidon_hash_many(std::span<const FieldElement> elements) {
    PoseidonHasher hasher;
    for (const auto& element : elements) {
        hasher.update(element);
    }
    return hasher.finalize();
}

}  // namespace starksign::crypto
