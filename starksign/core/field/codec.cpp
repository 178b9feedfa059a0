// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "codec.hpp"

#include <limits>

#include <starksign/core/common/util.hpp>

namespace starksign {

namespace {

    // Maximum count of significant hex digits in a 256-bit value
    constexpr size_t kMaxHexDigits{64};

    std::string_view strip_sign(std::string_view s, bool& negative) {
        negative = false;
        if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
            negative = s.front() == '-';
            s.remove_prefix(1);
        }
        return s;
    }

    //! Accumulates base-10 digits, failing once the value exceeds the given limit
    Result<intx::uint256> accumulate_decimal(std::string_view digits, const intx::uint256& limit,
                                             std::string_view field) {
        if (!is_decimal(digits)) {
            return make_error(ErrorCode::kInvalidEncoding, std::string{field}, "not a decimal number");
        }
        intx::uint256 value{0};
        for (const char c : digits) {
            const auto digit{static_cast<uint64_t>(c - '0')};
            if (value > (limit - digit) / 10) {
                return make_error(ErrorCode::kValueOutOfRange, std::string{field}, "decimal value too large");
            }
            value = value * 10 + digit;
        }
        return value;
    }

}  // namespace

Result<intx::uint256> parse_uint256_hex(std::string_view s, std::string_view field) {
    const std::string_view digits{strip_hex_prefix(s)};
    if (digits.empty()) {
        return make_error(ErrorCode::kInvalidEncoding, std::string{field}, "empty hex string");
    }
    intx::uint256 value{0};
    size_t significant_digits{0};
    for (const char c : digits) {
        const auto digit{decode_hex_digit(c)};
        if (!digit) {
            return make_error(ErrorCode::kInvalidEncoding, std::string{field}, "invalid hex digit");
        }
        if (significant_digits == 0 && *digit == 0) {
            continue;
        }
        if (++significant_digits > kMaxHexDigits) {
            return make_error(ErrorCode::kValueOutOfRange, std::string{field}, "hex value wider than 256 bits");
        }
        value = (value << 4) | intx::uint256{*digit};
    }
    return value;
}

Result<FieldElement> parse_hex(std::string_view s, std::string_view field) {
    return parse_uint256_hex(s, field).and_then([field](const intx::uint256& value) {
        return FieldElement::from_uint256(value, field);
    });
}

Result<FieldElement> parse_decimal(std::string_view s, std::string_view field) {
    return accumulate_decimal(s, kFieldPrime - 1, field).and_then([field](const intx::uint256& value) {
        return FieldElement::from_uint256(value, field);
    });
}

Result<uint64_t> parse_u64(std::string_view s, std::string_view field) {
    bool negative{false};
    const auto digits{strip_sign(s, negative)};
    if (negative) {
        return make_error(ErrorCode::kInvalidEncoding, std::string{field}, "unsigned value expected");
    }
    const auto value{accumulate_decimal(digits, std::numeric_limits<uint64_t>::max(), field)};
    if (!value) {
        return tl::unexpected{value.error()};
    }
    return static_cast<uint64_t>(*value);
}

Result<int64_t> parse_i64(std::string_view s, std::string_view field) {
    bool negative{false};
    const auto digits{strip_sign(s, negative)};
    // |INT64_MIN| is one above INT64_MAX
    const intx::uint256 limit{static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + (negative ? 1u : 0u)};
    const auto magnitude{accumulate_decimal(digits, limit, field)};
    if (!magnitude) {
        return tl::unexpected{magnitude.error()};
    }
    const auto unsigned_magnitude{static_cast<uint64_t>(*magnitude)};
    return negative ? static_cast<int64_t>(~unsigned_magnitude + 1) : static_cast<int64_t>(unsigned_magnitude);
}

Result<uint32_t> parse_u32(std::string_view s, std::string_view field) {
    return parse_u64(s, field).and_then([field](uint64_t value) { return narrow_u32(value, field); });
}

Result<uint32_t> narrow_u32(uint64_t value, std::string_view field) {
    if (value > std::numeric_limits<uint32_t>::max()) {
        return make_error(ErrorCode::kValueOutOfRange, std::string{field}, "value exceeds 32 bits");
    }
    return static_cast<uint32_t>(value);
}

std::string to_fixed_hex(const intx::uint256& value) {
    return to_hex(to_bytes32(value), /*with_prefix=*/true);
}

std::string to_minimal_hex(const intx::uint256& value) {
    return "0x" + intx::hex(value);
}

Bytes32 to_bytes32(const intx::uint256& value) noexcept {
    Bytes32 out{};
    intx::be::unsafe::store(out.data(), value);
    return out;
}

Bytes to_minimal_bytes(const intx::uint256& value) {
    if (value == 0) {
        return Bytes{0x00};
    }
    const Bytes32 full{to_bytes32(value)};
    return Bytes{zeroless_view(full)};
}

}  // namespace starksign
