// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "sha256.hpp"

#include <catch2/catch.hpp>

#include <starksign/core/common/bytes_to_string.hpp>
#include <starksign/core/common/util.hpp>

namespace starksign::crypto {

TEST_CASE("SHA256 of empty string", "[starksign][core][crypto]") {
    CHECK(to_hex(sha256(ByteView{}), true) == "0xe3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("SHA256 sample", "[starksign][core][crypto]") {
    CHECK(to_hex(sha256(string_view_to_byte_view("abc")), true) ==
          "0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("HMAC-SHA256 RFC 4231 vectors", "[starksign][core][crypto]") {
    SECTION("test case 1") {
        const Bytes key(20, 0x0b);
        CHECK(to_hex(hmac_sha256(key, string_view_to_byte_view("Hi There"))) ==
              "b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7");
    }
    SECTION("test case 2") {
        const ByteView key{string_view_to_byte_view("Jefe")};
        const ByteView data{string_view_to_byte_view("what do ya want for nothing?")};
        CHECK(to_hex(hmac_sha256(key, data)) ==
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    }
}

}  // namespace starksign::crypto
