#pragma once

#include <optional>

#include "parkpool/payment.hpp"
#include "parkpool/slot_pool.hpp"

namespace parkpool {

struct CheckoutResult {
    ReleaseStatus status = ReleaseStatus::Released;
    Amount amount{};
    std::optional<Confirmation> confirmation; // empty when nothing was charged
};

// Settle, confirm and release one occupancy.
//
// The gate is only called while holding the slot's settlement claim, so at
// most one charge per occupancy is in flight. A concurrent call for the same
// occupancy throws SettlementInProgress without charging. A slot that is
// already Paid is released without going back to the gate, and a handle
// whose occupancy is gone reports Released with nothing charged.
//
// PaymentDeclined (or any other failure from the gate) gives the claim back
// and leaves the slot Occupied, ready for another attempt. SettlementMismatch
// keeps the claim: the slot stays Occupied until someone reconciles the
// charge and calls SlotPool::confirmPayment().
CheckoutResult checkout(SlotPool& pool, const SlotHandle& h, IPaymentGate& gate);

} // namespace parkpool
