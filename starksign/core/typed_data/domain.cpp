// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "domain.hpp"

#include <starksign/core/crypto/poseidon.hpp>
#include <starksign/core/field/short_string.hpp>

namespace starksign {

Result<FieldElement> domain_hash(const StarknetDomain& domain) {
    const auto name{encode_short_string(domain.name, "domain_name")};
    if (!name) return tl::unexpected{name.error()};
    const auto version{encode_short_string(domain.version, "domain_version")};
    if (!version) return tl::unexpected{version.error()};
    const auto chain_id{encode_short_string(domain.chain_id, "domain_chain_id")};
    if (!chain_id) return tl::unexpected{chain_id.error()};

    crypto::PoseidonHasher hasher;
    hasher.update(FieldElement::reduce(kStarknetDomainSelector));
    hasher.update(*name);
    hasher.update(*version);
    hasher.update(*chain_id);
    hasher.update(FieldElement::from_u64(domain.revision));
    return hasher.finalize();
}

Result<FieldElement> message_hash(const StarknetDomain& domain, const FieldElement& public_key,
                                  const FieldElement& struct_hash) {
    const auto prefix{encode_short_string(kStarknetMessagePrefix)};
    if (!prefix) return tl::unexpected{prefix.error()};
    const auto domain_digest{domain_hash(domain)};
    if (!domain_digest) return tl::unexpected{domain_digest.error()};

    crypto::PoseidonHasher hasher;
    hasher.update(*prefix);
    hasher.update(*domain_digest);
    hasher.update(public_key);
    hasher.update(struct_hash);
    return hasher.finalize();
}

}  // namespace starksign
