// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string_view>

#include <intx/intx.hpp>

#include <starksign/core/common/error.hpp>
#include <starksign/core/field/constants.hpp>

namespace starksign {

//! \brief An element of the StarkNet prime field, always in canonical form [0, P)
class FieldElement {
  public:
    constexpr FieldElement() noexcept = default;

    //! \brief Accepts only values below the field prime
    //! \param [in] field : name reported on failure
    static Result<FieldElement> from_uint256(const intx::uint256& value, std::string_view field = {});

    static FieldElement from_u64(uint64_t value) noexcept { return FieldElement{value}; }

    //! \brief Maps negative values to P - |value|
    static FieldElement from_i64(int64_t value) noexcept;

    //! \brief Reduces any 256-bit value modulo P
    static FieldElement reduce(const intx::uint256& value) noexcept { return FieldElement{value % kFieldPrime}; }

    [[nodiscard]] const intx::uint256& value() const noexcept { return value_; }
    [[nodiscard]] bool is_zero() const noexcept { return value_ == 0; }

    FieldElement operator+(const FieldElement& rhs) const noexcept;
    FieldElement operator-(const FieldElement& rhs) const noexcept;
    FieldElement operator-() const noexcept;
    FieldElement operator*(const FieldElement& rhs) const noexcept;

    FieldElement& operator+=(const FieldElement& rhs) noexcept { return *this = *this + rhs; }

    //! \brief x^3, the Poseidon S-box
    [[nodiscard]] FieldElement cube() const noexcept;

    friend bool operator==(const FieldElement& lhs, const FieldElement& rhs) noexcept {
        return lhs.value_ == rhs.value_;
    }
    friend bool operator!=(const FieldElement& lhs, const FieldElement& rhs) noexcept { return !(lhs == rhs); }

  private:
    explicit constexpr FieldElement(const intx::uint256& value) noexcept : value_{value} {}

    intx::uint256 value_{0};
};

}  // namespace starksign
