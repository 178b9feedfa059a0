// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <intx/intx.hpp>

#include <starksign/core/common/base.hpp>
#include <starksign/core/common/error.hpp>
#include <starksign/core/field/field_element.hpp>

namespace starksign {

//! \brief Parses a hex number with optional 0x/0X prefix, case insensitive
//! \param [in] s : the input string
//! \param [in] field : name of the input, reported on failure
//! \return kInvalidEncoding for an empty or non-hex body, kValueOutOfRange above 256 bits
Result<intx::uint256> parse_uint256_hex(std::string_view s, std::string_view field);

//! \brief Same as parse_uint256_hex, additionally bounded by the field prime
Result<FieldElement> parse_hex(std::string_view s, std::string_view field);

//! \brief Parses a base-10 field element
Result<FieldElement> parse_decimal(std::string_view s, std::string_view field);

// Base-10 machine integers with an optional leading sign, '-' accepted only by parse_i64
Result<uint64_t> parse_u64(std::string_view s, std::string_view field);
Result<int64_t> parse_i64(std::string_view s, std::string_view field);
Result<uint32_t> parse_u32(std::string_view s, std::string_view field);

//! \brief Narrows an already parsed integer to 32 bits
Result<uint32_t> narrow_u32(uint64_t value, std::string_view field);

//! \brief 0x followed by exactly 64 lowercase hex digits
std::string to_fixed_hex(const intx::uint256& value);
inline std::string to_fixed_hex(const FieldElement& element) { return to_fixed_hex(element.value()); }

//! \brief 0x followed by lowercase hex digits without leading zeros, "0x0" for zero
std::string to_minimal_hex(const intx::uint256& value);
inline std::string to_minimal_hex(const FieldElement& element) { return to_minimal_hex(element.value()); }

//! \brief 32 bytes big-endian
Bytes32 to_bytes32(const intx::uint256& value) noexcept;

//! \brief Shortest big-endian representation, a single 0x00 byte for zero
Bytes to_minimal_bytes(const intx::uint256& value);

}  // namespace starksign
