// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <starksign/core/common/error.hpp>
#include <starksign/core/field/field_element.hpp>

namespace starksign::crypto {

//! \brief StarkWare Pedersen hash of two field elements
Result<FieldElement> pedersen_hash(const FieldElement& a, const FieldElement& b);

}  // namespace starksign::crypto
