// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "field_element.hpp"

#include <string>

namespace starksign {

Result<FieldElement> FieldElement::from_uint256(const intx::uint256& value, std::string_view field) {
    if (value >= kFieldPrime) {
        return make_error(ErrorCode::kValueOutOfRange, std::string{field}, "value not below field prime");
    }
    return FieldElement{value};
}

FieldElement FieldElement::from_i64(int64_t value) noexcept {
    if (value >= 0) {
        return from_u64(static_cast<uint64_t>(value));
    }
    // Two's complement negation of the unsigned image handles INT64_MIN
    const auto magnitude{~static_cast<uint64_t>(value) + 1};
    return -from_u64(magnitude);
}

FieldElement FieldElement::operator+(const FieldElement& rhs) const noexcept {
    return FieldElement{intx::addmod(value_, rhs.value_, kFieldPrime)};
}

FieldElement FieldElement::operator-(const FieldElement& rhs) const noexcept {
    return *this + (-rhs);
}

FieldElement FieldElement::operator-() const noexcept {
    return is_zero() ? *this : FieldElement{kFieldPrime - value_};
}

FieldElement FieldElement::operator*(const FieldElement& rhs) const noexcept {
    return FieldElement{intx::mulmod(value_, rhs.value_, kFieldPrime)};
}

FieldElement FieldElement::cube() const noexcept {
    return *this * *this * *this;
}

}  // namespace starksign
