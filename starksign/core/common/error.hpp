// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <utility>

#include <tl/expected.hpp>

namespace starksign {

// Error codes for input decoding, key derivation and signing
enum class [[nodiscard]] ErrorCode {
    kInvalidEncoding,          // not a hex or decimal string
    kValueOutOfRange,          // valid encoding, value outside the accepted domain
    kStringTooLong,            // short string above 31 bytes
    kInvalidSignatureLength,   // Ethereum signature shorter than its r component
    kKeyDerivationExhausted,   // grinding hit its iteration ceiling
    kInvalidNonce,             // signer ran out of retry seeds
};

struct Error {
    ErrorCode code;
    //! Name of the offending input, empty when not attributable to a single field
    std::string field;
    std::string detail;

    //! \brief Renders as "<code name> [field]: detail"
    std::string to_string() const;
};

bool operator==(const Error& lhs, const Error& rhs);

inline tl::unexpected<Error> make_error(ErrorCode code, std::string field, std::string detail = {}) {
    return tl::unexpected<Error>{Error{code, std::move(field), std::move(detail)}};
}

template <class T>
using Result = tl::expected<T, Error>;

}  // namespace starksign
