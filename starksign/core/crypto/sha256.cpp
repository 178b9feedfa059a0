// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "sha256.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <starksign/infra/common/ensure.hpp>

namespace starksign::crypto {

Bytes32 sha256(ByteView data) {
    Bytes32 digest{};
    unsigned int length{0};
    const int ok{EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr)};
    ensure(ok == 1 && length == kWordLength, "EVP_Digest failed to produce a SHA-256 digest");
    return digest;
}

Bytes32 hmac_sha256(ByteView key, ByteView data) {
    Bytes32 mac{};
    unsigned int length{0};
    const unsigned char* result{HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data.data(), data.size(),
                                     mac.data(), &length)};
    ensure(result != nullptr && length == kWordLength, "HMAC failed to produce a SHA-256 tag");
    return mac;
}

}  // namespace starksign::crypto
