// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <intx/intx.hpp>

namespace starksign {

//! StarkNet field prime P = 2^251 + 17 * 2^192 + 1
inline constexpr intx::uint256 kFieldPrime{
    intx::from_string<intx::uint256>("0x800000000000011000000000000000000000000000000000000000000000001")};

//! Order N of the Stark curve group
inline constexpr intx::uint256 kCurveOrder{
    intx::from_string<intx::uint256>("0x800000000000010ffffffffffffffffb781126dcae7b2321e66a241adc64d2f")};

//! Exclusive upper bound for message hashes and emitted signature components (2^251)
inline constexpr intx::uint256 kEcdsaUpperBound{intx::uint256{1} << 251};

// Type selectors of the structured messages
inline constexpr intx::uint256 kStarknetDomainSelector{
    intx::from_string<intx::uint256>("0x1ff2f602e42168014d405a94f75e8a93d640751d71d16311266e140d8b0a210")};
inline constexpr intx::uint256 kOrderSelector{
    intx::from_string<intx::uint256>("0x36da8d51815527cabfaa9c982f564c80fa7429616739306036f1f9b608dd112")};
inline constexpr intx::uint256 kTransferArgsSelector{
    intx::from_string<intx::uint256>("0x1db88e2709fdf2c59e651d141c3296a42b209ce770871b40413ea109846a3b4")};
inline constexpr intx::uint256 kWithdrawalArgsSelector{
    intx::from_string<intx::uint256>("0x250a5fa378e8b771654bd43dcb34844534f9d1e29e16b14760d7936ea7f4b1d")};

//! Prefix of every off-chain message hash, encoded as a short string
inline constexpr std::string_view kStarknetMessagePrefix{"StarkNet Message"};

//! Longest string that fits into a field element
inline constexpr size_t kMaxShortStringLength{31};

}  // namespace starksign
