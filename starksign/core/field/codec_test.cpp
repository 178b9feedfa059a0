// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "codec.hpp"

#include <limits>

#include <catch2/catch.hpp>

#include <starksign/core/common/util.hpp>

namespace starksign {

TEST_CASE("Hex field parsing", "[starksign][core][field]") {
    SECTION("prefix and case are optional") {
        const auto lower{parse_hex("0x5d05989e9302dcebc74e241001e3e3ac3f4402ccf2f8e6f74b034b07ad6a904", "key")};
        const auto upper{parse_hex("0X5D05989E9302DCEBC74E241001E3E3AC3F4402CCF2F8E6F74B034B07AD6A904", "key")};
        const auto bare{parse_hex("5d05989e9302dcebc74e241001e3e3ac3f4402ccf2f8e6f74b034b07ad6a904", "key")};
        REQUIRE((lower && upper && bare));
        CHECK(*lower == *upper);
        CHECK(*lower == *bare);
    }
    SECTION("leading zeros do not count against the width") {
        const std::string padded{"0x" + std::string(100, '0') + "2"};
        const auto element{parse_hex(padded, "asset")};
        REQUIRE(element);
        CHECK(*element == FieldElement::from_u64(2));
    }
    SECTION("empty body") {
        for (const auto* input : {"", "0x", "0X"}) {
            const auto element{parse_hex(input, "asset")};
            REQUIRE(!element);
            CHECK(element.error().code == ErrorCode::kInvalidEncoding);
            CHECK(element.error().field == "asset");
        }
    }
    SECTION("non hex digit") {
        const auto element{parse_hex("0x12g4", "asset")};
        REQUIRE(!element);
        CHECK(element.error().code == ErrorCode::kInvalidEncoding);
    }
    SECTION("field prime boundary") {
        CHECK(parse_hex("0x800000000000011000000000000000000000000000000000000000000000000", "v"));
        const auto at_prime{parse_hex("0x800000000000011000000000000000000000000000000000000000000000001", "v")};
        REQUIRE(!at_prime);
        CHECK(at_prime.error().code == ErrorCode::kValueOutOfRange);
    }
    SECTION("wider than 256 bits") {
        const auto wide{parse_uint256_hex("0x1" + std::string(64, '0'), "v")};
        REQUIRE(!wide);
        CHECK(wide.error().code == ErrorCode::kValueOutOfRange);
        const auto max{parse_uint256_hex(std::string(64, 'f'), "v")};
        REQUIRE(max);
        CHECK(*max == std::numeric_limits<intx::uint256>::max());
    }
}

TEST_CASE("Decimal field parsing", "[starksign][core][field]") {
    const auto salt{parse_decimal("6", "salt")};
    REQUIRE(salt);
    CHECK(*salt == FieldElement::from_u64(6));

    const auto key{parse_decimal("2629686405885377265612250192330550814166101744721025672593857097107510831364", "key")};
    REQUIRE(key);
    CHECK(to_minimal_hex(*key) == "0x5d05989e9302dcebc74e241001e3e3ac3f4402ccf2f8e6f74b034b07ad6a904");

    const auto prime{parse_decimal(intx::to_string(kFieldPrime), "salt")};
    REQUIRE(!prime);
    CHECK(prime.error().code == ErrorCode::kValueOutOfRange);

    const auto huge{parse_decimal(std::string(90, '9'), "salt")};
    REQUIRE(!huge);
    CHECK(huge.error().code == ErrorCode::kValueOutOfRange);

    for (const auto* input : {"", "-1", "0x10", "1e3", " 1"}) {
        const auto bad{parse_decimal(input, "salt")};
        REQUIRE(!bad);
        CHECK(bad.error().code == ErrorCode::kInvalidEncoding);
    }
}

TEST_CASE("Machine integer parsing", "[starksign][core][field]") {
    SECTION("u64") {
        CHECK(parse_u64("74", "fee") == 74u);
        CHECK(parse_u64("+74", "fee") == 74u);
        CHECK(parse_u64("18446744073709551615", "fee") == std::numeric_limits<uint64_t>::max());
        CHECK(parse_u64("18446744073709551616", "fee").error().code == ErrorCode::kValueOutOfRange);
        CHECK(parse_u64("-1", "fee").error().code == ErrorCode::kInvalidEncoding);
        CHECK(parse_u64("7.4", "fee").error().code == ErrorCode::kInvalidEncoding);
    }
    SECTION("i64") {
        CHECK(parse_i64("-156", "amount") == -156);
        CHECK(parse_i64("100", "amount") == 100);
        CHECK(parse_i64("9223372036854775807", "amount") == std::numeric_limits<int64_t>::max());
        CHECK(parse_i64("-9223372036854775808", "amount") == std::numeric_limits<int64_t>::min());
        CHECK(parse_i64("9223372036854775808", "amount").error().code == ErrorCode::kValueOutOfRange);
        CHECK(parse_i64("-9223372036854775809", "amount").error().code == ErrorCode::kValueOutOfRange);
        CHECK(parse_i64("-", "amount").error().code == ErrorCode::kInvalidEncoding);
    }
    SECTION("u32") {
        CHECK(parse_u32("1", "revision") == 1u);
        CHECK(parse_u32("4294967295", "revision") == std::numeric_limits<uint32_t>::max());
        const auto too_big{parse_u32("4294967296", "revision")};
        REQUIRE(!too_big);
        CHECK(too_big.error().code == ErrorCode::kValueOutOfRange);
        CHECK(too_big.error().field == "revision");
        CHECK(narrow_u32(uint64_t{1} << 32, "position_id").error().field == "position_id");
    }
}

TEST_CASE("Hex formatting", "[starksign][core][field]") {
    SECTION("fixed width") {
        CHECK(to_fixed_hex(intx::uint256{0}) == "0x" + std::string(64, '0'));
        CHECK(to_fixed_hex(FieldElement::from_u64(0xab)) == "0x" + std::string(62, '0') + "ab");
        CHECK(to_fixed_hex(kCurveOrder) == "0x0800000000000010ffffffffffffffffb781126dcae7b2321e66a241adc64d2f");
    }
    SECTION("minimal width") {
        CHECK(to_minimal_hex(FieldElement{}) == "0x0");
        CHECK(to_minimal_hex(FieldElement::from_u64(0x0a)) == "0xa");
        CHECK(to_minimal_hex(kCurveOrder) == "0x800000000000010ffffffffffffffffb781126dcae7b2321e66a241adc64d2f");
    }
    SECTION("minimal bytes") {
        CHECK(to_minimal_bytes(0) == Bytes{0x00});
        CHECK(to_minimal_bytes(0x1a2b) == Bytes{0x1a, 0x2b});
        CHECK(to_hex(to_minimal_bytes(std::numeric_limits<intx::uint256>::max())) == std::string(64, 'f'));
    }
}

}  // namespace starksign
