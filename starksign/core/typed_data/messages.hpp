// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <starksign/core/field/field_element.hpp>

namespace starksign {

struct Order {
    uint32_t position_id{0};
    FieldElement base_asset_id;
    int64_t base_amount{0};
    FieldElement quote_asset_id;
    int64_t quote_amount{0};
    FieldElement fee_asset_id;
    uint64_t fee_amount{0};
    uint64_t expiration{0};
    uint64_t salt{0};
};

struct Transfer {
    uint32_t recipient_position_id{0};
    uint32_t sender_position_id{0};
    FieldElement collateral_asset_id;
    uint64_t amount{0};
    uint64_t expiration{0};
    FieldElement salt;
};

struct Withdrawal {
    FieldElement recipient;
    uint32_t position_id{0};
    FieldElement collateral_asset_id;
    uint64_t amount{0};
    uint64_t expiration{0};
    FieldElement salt;
};

//! \brief Struct hash of an order, signed amounts map to P - |amount| when negative
//! \remarks The fee asset precedes the fee amount
FieldElement order_hash(const Order& order);

FieldElement transfer_hash(const Transfer& transfer);

FieldElement withdrawal_hash(const Withdrawal& withdrawal);

//! Buffer added to an order expiry before it enters the settlement hash
inline constexpr uint64_t kSettlementBufferSeconds{14 * 24 * 3600};

//! \brief Settlement expiration in whole seconds: the expiry plus 14 days, rounded up
uint64_t settlement_expiration(uint64_t expire_time_ms) noexcept;

}  // namespace starksign
