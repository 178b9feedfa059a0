// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>

#include <starksign/core/common/error.hpp>
#include <starksign/core/field/field_element.hpp>

namespace starksign {

//! \brief Encodes up to 31 bytes as a big-endian field element, right aligned in 32 bytes
//! \return kStringTooLong for longer inputs
Result<FieldElement> encode_short_string(std::string_view s, std::string_view field = {});

//! \brief Inverse of encode_short_string, leading zero bytes are dropped
std::string decode_short_string(const FieldElement& element);

}  // namespace starksign
