// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <optional>
#include <span>

#include <starksign/core/field/field_element.hpp>

namespace starksign::crypto {

// Hades permutation parameters over the StarkNet field
inline constexpr size_t kPoseidonWidth{3};
inline constexpr size_t kPoseidonFullRounds{8};
inline constexpr size_t kPoseidonPartialRounds{83};

using PoseidonState = std::array<FieldElement, kPoseidonWidth>;

//! \brief Applies the Hades permutation in place
void poseidon_permute(PoseidonState& state);

//! \brief Incremental Poseidon sponge with rate 2
//! \remarks Absorbs elements in pairs into state[0] and state[1]. Finalization appends 1 and pads with 0 to an even
//! count, so the result equals poseidon_hash_many over all the updated elements
class PoseidonHasher {
  public:
    void update(const FieldElement& element);

    [[nodiscard]] FieldElement finalize() const;

  private:
    PoseidonState state_{};
    std::optional<FieldElement> pending_;
};

FieldElement poseidon_hash_many(std::span<const FieldElement> elements);

}  // namespace starksign::crypto
