// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "stark_curve.hpp"

#include <catch2/catch.hpp>

#include <starksign/core/field/codec.hpp>

namespace starksign::crypto {

TEST_CASE("Generator multiples", "[starksign][core][crypto][curve]") {
    SECTION("1 * G is the generator") {
        const auto x{generator_multiple_x(1, "k")};
        REQUIRE(x);
        CHECK(to_minimal_hex(*x) == "0x1ef15c18599971b7beced415a40f0c7deacfd9b0d1819e03d723d8bc943cfca");
    }
    SECTION("public key vector") {
        const auto x{generator_multiple_x(
            intx::from_string<intx::uint256>("0x3c1e9550e66958296d11b60f8e8e7a7ad990d07fa65d5f7652c4a6c87d4e3cc"), "k")};
        REQUIRE(x);
        CHECK(to_minimal_hex(*x) == "0x77a3b314db07c45076d11f62b6f9e748a39790441823307743cf00d6597ea43");
    }
    SECTION("scalars outside [1, N)") {
        for (const auto& scalar : {intx::uint256{0}, kCurveOrder, kCurveOrder + 1}) {
            const auto x{generator_multiple_x(scalar, "private_key")};
            REQUIRE(!x);
            CHECK(x.error().code == ErrorCode::kValueOutOfRange);
            CHECK(x.error().field == "private_key");
        }
    }
}

}  // namespace starksign::crypto
