// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "grind_key.hpp"

#include <array>

#include <catch2/catch.hpp>

#include <starksign/core/field/constants.hpp>

namespace starksign {

using intx::from_string;
using intx::uint256;

TEST_CASE("grind_key vectors", "[starksign][core][keys]") {
    SECTION("StarkWare reference seed") {
        const auto key{grind_key(from_string<uint256>("0x86F3E7293141F20A8BAFF320E8EE4ACCB9D4A4BF2B4D295E8CEE784DB46E0519"))};
        REQUIRE(key);
        CHECK(*key == from_string<uint256>("0x5c8c8683596c732541a59e03007b2d30dbbbb873556fe65b5fb63c16688f941"));
    }
    SECTION("zero seed is hashed as a single zero byte") {
        const auto key{grind_key(0)};
        REQUIRE(key);
        CHECK(*key == from_string<uint256>("0x6a296d224f284947bee93c30f8a309670dd8eeb197b30f81dd40fc4d2186279"));
    }
    SECTION("seed whose first digest is rejected") {
        const auto key{grind_key(26)};
        REQUIRE(key);
        CHECK(*key == from_string<uint256>("0x5018a81b2c2caae35b254bc08592e1a7688c8628731a5fd39a03809f1b18e72"));
    }
}

TEST_CASE("grind_key iteration ceiling", "[starksign][core][keys]") {
    CHECK(grind_key(26, 2));
    const auto exhausted{grind_key(26, 1)};
    REQUIRE(!exhausted);
    CHECK(exhausted.error().code == ErrorCode::kKeyDerivationExhausted);

    const auto no_iterations{grind_key(0, 0)};
    REQUIRE(!no_iterations);
    CHECK(no_iterations.error().code == ErrorCode::kKeyDerivationExhausted);
}

TEST_CASE("grind_key output distribution", "[starksign][core][keys]") {
    constexpr size_t kBuckets{16};
    constexpr uint64_t kSamples{4000};
    std::array<uint64_t, kBuckets> histogram{};
    for (uint64_t seed{0}; seed < kSamples; ++seed) {
        const auto key{grind_key(seed)};
        REQUIRE(key);
        REQUIRE(*key < kCurveOrder);
        const auto bucket{static_cast<size_t>((*key << 4) / kCurveOrder)};
        ++histogram[bucket];
    }
    const double expected{static_cast<double>(kSamples) / kBuckets};
    double chi_square{0};
    for (const auto count : histogram) {
        const double delta{static_cast<double>(count) - expected};
        chi_square += delta * delta / expected;
    }
    // 99.9th percentile of chi-square with 15 degrees of freedom
    CHECK(chi_square < 37.7);
}

}  // namespace starksign
