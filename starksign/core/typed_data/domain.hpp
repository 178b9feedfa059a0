// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>

#include <starksign/core/common/error.hpp>
#include <starksign/core/field/field_element.hpp>

namespace starksign {

//! \brief Signing domain separating messages across deployments
//! \remarks name, version and chain_id are encoded as short strings and must not exceed 31 bytes
struct StarknetDomain {
    std::string name;
    std::string version;
    std::string chain_id;
    uint32_t revision{1};
};

inline const StarknetDomain kMainnetDomain{"Perpetuals", "v0", "SN_MAIN", 1};
inline const StarknetDomain kTestnetDomain{"Perpetuals", "v0", "SN_SEPOLIA", 1};

//! \brief Poseidon(DOMAIN_SELECTOR, name, version, chain_id, revision)
//! \return kStringTooLong naming the offending domain field
Result<FieldElement> domain_hash(const StarknetDomain& domain);

//! \brief Poseidon("StarkNet Message", domain_hash, public_key, struct_hash)
Result<FieldElement> message_hash(const StarknetDomain& domain, const FieldElement& public_key,
                                  const FieldElement& struct_hash);

}  // namespace starksign
