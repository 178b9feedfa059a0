// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#include "messages.hpp"

#include <starksign/core/crypto/poseidon.hpp>

namespace starksign {

FieldElement order_hash(const Order& order) {
    crypto::PoseidonHasher hasher;
    hasher.update(FieldElement::reduce(kOrderSelector));
    hasher.update(FieldElement::from_u64(order.position_id));
    hasher.update(order.base_asset_id);
    hasher.update(FieldElement::from_i64(order.base_amount));
    hasher.update(order.quote_asset_id);
    hasher.update(FieldElement::from_i64(order.quote_amount));
    hasher.update(order.fee_asset_id);
    hasher.update(FieldElement::from_u64(order.fee_amount));
    hasher.update(FieldElement::from_u64(order.expiration));
    hasher.update(FieldElement::from_u64(order.salt));
    return hasher.finalize();
}

FieldElement transfer_hash(const Transfer& transfer) {
    crypto::PoseidonHasher hasher;
    hasher.update(FieldElement::reduce(kTransferArgsSelector));
    hasher.update(FieldElement::from_u64(transfer.recipient_position_id));
    hasher.update(FieldElement::from_u64(transfer.sender_position_id));
    hasher.update(transfer.collateral_asset_id);
    hasher.update(FieldElement::from_u64(transfer.amount));
    hasher.update(FieldElement::from_u64(transfer.expiration));
    hasher.update(transfer.salt);
    return hasher.finalize();
}

FieldElement withdrawal_hash(const Withdrawal& withdrawal) {
    crypto::PoseidonHasher hasher;
    hasher.update(FieldElement::reduce(kWithdrawalArgsSelector));
    hasher.update(withdrawal.recipient);
    hasher.update(FieldElement::from_u64(withdrawal.position_id));
    hasher.update(withdrawal.collateral_asset_id);
    hasher.update(FieldElement::from_u64(withdrawal.amount));
    hasher.update(FieldElement::from_u64(withdrawal.expiration));
    hasher.update(withdrawal.salt);
    return hasher.finalize();
}

uint64_t settlement_expiration(uint64_t expire_time_ms) noexcept {
    return expire_time_ms / 1000 + (expire_time_ms % 1000 != 0 ? 1 : 0) + kSettlementBufferSeconds;
}

}  // namespace starksign
