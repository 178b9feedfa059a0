// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <starksign/core/common/base.hpp>

namespace starksign {

//! \brief Strips leftmost zeroed bytes from byte sequence
//! \param [in] data : The view to process
//! \return A new view of the sequence
ByteView zeroless_view(ByteView data);

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

inline std::string_view strip_hex_prefix(std::string_view s) {
    return has_hex_prefix(s) ? s.substr(2) : s;
}

//! \brief Whether the input is a non-empty run of base-10 digits
bool is_decimal(std::string_view s) noexcept;

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

std::optional<unsigned> decode_hex_digit(char ch) noexcept;

}  // namespace starksign
