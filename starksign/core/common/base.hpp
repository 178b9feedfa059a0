// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic types and constants.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace starksign {

using Bytes = std::basic_string<uint8_t>;

class ByteView : public std::basic_string_view<uint8_t> {
  public:
    constexpr ByteView() noexcept = default;

    constexpr ByteView(const std::basic_string_view<uint8_t>& other) noexcept
        : std::basic_string_view<uint8_t>{other.data(), other.length()} {}

    ByteView(const Bytes& str) noexcept : std::basic_string_view<uint8_t>{str.data(), str.length()} {}

    constexpr ByteView(const uint8_t* data, size_type length) noexcept
        : std::basic_string_view<uint8_t>{data, length} {}

    template <std::size_t N>
    constexpr ByteView(const uint8_t (&array)[N]) noexcept : std::basic_string_view<uint8_t>{array, N} {}

    template <std::size_t N>
    constexpr ByteView(const std::array<uint8_t, N>& array) noexcept
        : std::basic_string_view<uint8_t>{array.data(), N} {}
};

// Size of a serialized field element, a scalar and a SHA-256 digest
inline constexpr size_t kWordLength{32};

using Bytes32 = std::array<uint8_t, kWordLength>;

}  // namespace starksign
