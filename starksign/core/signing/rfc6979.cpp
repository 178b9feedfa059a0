// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "rfc6979.hpp"

#include <string>

#include <starksign/core/crypto/sha256.hpp>
#include <starksign/core/crypto/stark_curve.hpp>
#include <starksign/core/field/codec.hpp>

namespace starksign {

namespace {

    //! HMAC_DRBG state of RFC 6979 section 3.2
    class HmacDrbg {
      public:
        HmacDrbg(ByteView entropy, ByteView nonce, ByteView personalization) {
            key_.fill(0x00);
            value_.fill(0x01);
            for (uint8_t separator : {uint8_t{0x00}, uint8_t{0x01}}) {
                Bytes data{value_.data(), value_.size()};
                data.push_back(separator);
                data.append(entropy);
                data.append(nonce);
                data.append(personalization);
                key_ = crypto::hmac_sha256(key_, data);
                value_ = crypto::hmac_sha256(key_, value_);
            }
        }

        const Bytes32& generate() {
            value_ = crypto::hmac_sha256(key_, value_);
            return value_;
        }

        //! Step h.3 after a rejected candidate
        void reseed() {
            Bytes data{value_.data(), value_.size()};
            data.push_back(0x00);
            key_ = crypto::hmac_sha256(key_, data);
            value_ = crypto::hmac_sha256(key_, value_);
        }

      private:
        Bytes32 key_{};
        Bytes32 value_{};
    };

}  // namespace

Result<intx::uint256> generate_k(const intx::uint256& private_key, const FieldElement& msg_hash,
                                 const intx::uint256& seed) {
    const Bytes32 entropy{to_bytes32(private_key)};
    const Bytes32 nonce{to_bytes32(msg_hash.value())};
    const Bytes personalization{seed == 0 ? Bytes{} : to_minimal_bytes(seed)};

    HmacDrbg drbg{entropy, nonce, personalization};
    for (uint32_t draw{0}; draw < kMaxNonceDraws; ++draw) {
        const Bytes32& block{drbg.generate()};
        const auto candidate{intx::be::unsafe::load<intx::uint256>(block.data()) >> 4};
        if (crypto::is_valid_scalar(candidate)) {
            return candidate;
        }
        drbg.reseed();
    }
    return make_error(ErrorCode::kInvalidNonce, "k", "no nonce accepted in " + std::to_string(kMaxNonceDraws) + " draws");
}

}  // namespace starksign
