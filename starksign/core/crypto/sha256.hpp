// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <starksign/core/common/base.hpp>

namespace starksign::crypto {

//! \brief SHA-256 digest of the input
Bytes32 sha256(ByteView data);

//! \brief HMAC-SHA256 keyed by the given key
Bytes32 hmac_sha256(ByteView key, ByteView data);

}  // namespace starksign::crypto
