// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Utilities for type casting

#include <string_view>

#include <starksign/core/common/base.hpp>

namespace starksign {

// Cast a pointer to char into a pointer to unsigned char (i.e. uint8_t)
inline const uint8_t* byte_ptr_cast(const char* ptr) { return reinterpret_cast<const uint8_t*>(ptr); }

inline ByteView string_view_to_byte_view(std::string_view v) { return {byte_ptr_cast(v.data()), v.size()}; }

}  // namespace starksign
