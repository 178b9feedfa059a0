// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "short_string.hpp"

#include <algorithm>

#include <starksign/core/common/util.hpp>
#include <starksign/core/field/codec.hpp>

namespace starksign {

Result<FieldElement> encode_short_string(std::string_view s, std::string_view field) {
    if (s.size() > kMaxShortStringLength) {
        return make_error(ErrorCode::kStringTooLong, std::string{field},
                          "short string of " + std::to_string(s.size()) + " bytes");
    }
    Bytes32 buffer{};
    std::copy(s.begin(), s.end(), buffer.begin() + static_cast<std::ptrdiff_t>(kWordLength - s.size()));
    // The top byte stays zero so the value is below 2^248 < P
    return FieldElement::from_uint256(intx::be::unsafe::load<intx::uint256>(buffer.data()), field);
}

std::string decode_short_string(const FieldElement& element) {
    const Bytes32 buffer{to_bytes32(element.value())};
    const ByteView text{zeroless_view(buffer)};
    return std::string{text.begin(), text.end()};
}

}  // namespace starksign
