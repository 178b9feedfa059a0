// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <magic_enum.hpp>

namespace starksign {

std::string Error::to_string() const {
    std::string out{magic_enum::enum_name(code)};
    if (!field.empty()) {
        out += " [" + field + "]";
    }
    if (!detail.empty()) {
        out += ": " + detail;
    }
    return out;
}

bool operator==(const Error& lhs, const Error& rhs) {
    return lhs.code == rhs.code && lhs.field == rhs.field && lhs.detail == rhs.detail;
}

}  // namespace starksign
