// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <intx/intx.hpp>

#include <starksign/core/common/error.hpp>
#include <starksign/core/field/field_element.hpp>

namespace starksign {

//! \brief Second signature component to emit
enum class SignatureForm {
    kStandard,  // s = k^-1 * (z + r * private_key) mod N
    kInverted,  // w = s^-1 mod N, as consumed by the StarkEx verifier
};

struct SignerSettings {
    SignatureForm form{SignatureForm::kStandard};
    //! Number of retry seeds tried before giving up
    uint32_t max_attempts{16};
};

struct Signature {
    intx::uint256 r;
    intx::uint256 s;

    friend bool operator==(const Signature&, const Signature&) = default;
};

//! \brief Deterministic Stark ECDSA signature over a message hash
//! \param [in] private_key : must be in [1, N)
//! \param [in] msg_hash : must be below 2^251
//! \return kValueOutOfRange on precondition violation, kInvalidNonce when every retry seed yields an unusable nonce
Result<Signature> sign(const intx::uint256& private_key, const FieldElement& msg_hash,
                       const SignerSettings& settings = {});

//! \brief Signature with a caller supplied nonce, no retry
//! \return kInvalidNonce when r, s or the emitted component is out of range
Result<Signature> sign_with_nonce(const intx::uint256& private_key, const FieldElement& msg_hash,
                                  const intx::uint256& k, SignatureForm form = SignatureForm::kStandard);

//! \brief Modular inverse modulo the curve order through Fermat's little theorem
intx::uint256 inverse_mod_order(const intx::uint256& value) noexcept;

}  // namespace starksign
