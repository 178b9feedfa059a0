// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <algorithm>

namespace starksign {

ByteView zeroless_view(ByteView data) {
    const auto first_non_zero{std::find_if(data.begin(), data.end(), [](const auto& b) { return b != 0x0; })};
    return data.substr(static_cast<size_t>(std::distance(data.begin(), first_non_zero)));
}

bool is_decimal(std::string_view s) noexcept {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string to_hex(ByteView bytes, bool with_prefix) {
    static const char* kHexDigits{"0123456789abcdef"};
    std::string out(bytes.length() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{&out[0]};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::optional<unsigned> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') {
        return static_cast<unsigned>(ch - '0');
    }
    if (ch >= 'a' && ch <= 'f') {
        return static_cast<unsigned>(ch - 'a' + 10);
    }
    if (ch >= 'A' && ch <= 'F') {
        return static_cast<unsigned>(ch - 'A' + 10);
    }
    return std::nullopt;
}

}  // namespace starksign
