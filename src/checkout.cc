#include "parkpool/checkout.hpp"

#include <string>

#include "parkpool/errors.hpp"

namespace parkpool {

CheckoutResult checkout(SlotPool& pool, const SlotHandle& h, IPaymentGate& gate) {
    CheckoutResult r;
    switch (pool.state(h)) {
        case SlotState::Free:
            r.status = pool.release(h);
            return r;
        case SlotState::Paid:
            // settled by an earlier attempt; do not charge twice
            r.amount = pool.quoteFee(h);
            break;
        case SlotState::Occupied: {
            if (!pool.claimSettlement(h))
                throw SettlementInProgress("Slot " + std::to_string(h.slot()) +
                                           " is already being settled");
            r.amount = pool.quoteFee(h);
            Confirmation c;
            try {
                c = gate.settle(r.amount);
            } catch (...) {
                pool.abandonSettlement(h);
                throw;
            }
            // Keep the claim: money moved, a retry must not charge again.
            if (c.amount != r.amount)
                throw SettlementMismatch(std::string(gate.name()) + " settled " +
                                         std::to_string(c.amount) + ", expected " +
                                         std::to_string(r.amount));
            pool.confirmPayment(h);
            r.confirmation = std::move(c);
            break;
        }
    }
    r.status = pool.release(h);
    return r;
}

} // namespace parkpool
