// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "short_string.hpp"

#include <catch2/catch.hpp>

#include <starksign/core/field/codec.hpp>

namespace starksign {

TEST_CASE("Short string encoding", "[starksign][core][field]") {
    SECTION("known encodings") {
        const auto message{encode_short_string(kStarknetMessagePrefix)};
        REQUIRE(message);
        CHECK(to_minimal_hex(*message) == "0x537461726b4e6574204d657373616765");

        const auto version{encode_short_string("v0")};
        REQUIRE(version);
        CHECK(*version == FieldElement::from_u64(0x7630));

        const auto empty{encode_short_string("")};
        REQUIRE(empty);
        CHECK(empty->is_zero());
    }
    SECTION("round trip") {
        for (const auto* text : {"Perpetuals", "SN_SEPOLIA", "SN_MAIN", "a", "0123456789012345678901234567890"}) {
            const auto encoded{encode_short_string(text)};
            REQUIRE(encoded);
            CHECK(decode_short_string(*encoded) == text);
        }
    }
    SECTION("31 bytes fit, 32 bytes do not") {
        const std::string longest(31, 'z');
        const auto fits{encode_short_string(longest, "name")};
        REQUIRE(fits);
        CHECK(fits->value() < kFieldPrime);

        const auto too_long{encode_short_string(longest + "z", "name")};
        REQUIRE(!too_long);
        CHECK(too_long.error().code == ErrorCode::kStringTooLong);
        CHECK(too_long.error().field == "name");
    }
}

}  // namespace starksign
