// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <intx/intx.hpp>

#include <starksign/core/common/error.hpp>
#include <starksign/core/field/field_element.hpp>

namespace starksign::crypto {

//! \brief Whether the scalar is a valid private key or nonce, i.e. in [1, N)
inline bool is_valid_scalar(const intx::uint256& scalar) noexcept {
    return scalar != 0 && scalar < kCurveOrder;
}

//! \brief x coordinate of scalar * G on the Stark curve
//! \param [in] scalar : must be in [1, N), kValueOutOfRange otherwise
//! \param [in] field : name reported on failure
Result<FieldElement> generator_multiple_x(const intx::uint256& scalar, std::string_view field);

}  // namespace starksign::crypto
