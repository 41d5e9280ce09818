#include "parkpool/slot_pool.hpp"

#include <atomic>
#include <string>

#include "parkpool/errors.hpp"

namespace parkpool {

namespace {
std::atomic<TicketId> nextTicket{1}; // shared by all pools
} // namespace

const char* toString(SlotState s) {
    switch (s) {
        case SlotState::Free:     return "Free";
        case SlotState::Occupied: return "Occupied";
        case SlotState::Paid:     return "Paid";
    }
    return "Unknown";
}

const char* toString(ReleaseStatus s) {
    switch (s) {
        case ReleaseStatus::Released:        return "Released";
        case ReleaseStatus::PaymentRequired: return "PaymentRequired";
    }
    return "Unknown";
}

SlotPool::SlotPool(std::size_t capacity, FeeSchedule schedule)
    : schedule_(schedule), slots_(capacity) {
    validate(schedule_);
}

std::optional<SlotHandle> SlotPool::allocate(const Vehicle& vehicle,
                                             unsigned long long durationUnits) {
    // Fails on an unpriceable category before any slot is claimed.
    quote(schedule_, vehicle.category(), durationUnits);

    for (std::size_t i = 0; i < slots_.size(); ++i) {
        Slot& s = slots_[i];
        std::lock_guard<std::mutex> lk(s.mu);
        if (s.state != SlotState::Free) continue;

        TicketId t = nextTicket.fetch_add(1, std::memory_order_relaxed);
        s.state = SlotState::Occupied;
        s.occupant = vehicle;
        s.billedDurationUnits = durationUnits;
        s.ticket = t;
        s.settling = false;
        return SlotHandle(i, t);
    }
    return std::nullopt; // full
}

Amount SlotPool::quoteFee(const SlotHandle& h) const {
    const Slot& s = slotFor_(h);
    std::lock_guard<std::mutex> lk(s.mu);
    if (!holds_nolock(s, h))
        throw NotOccupied("Ticket " + std::to_string(h.ticket()) +
                          " no longer holds slot " + std::to_string(h.slot()));
    return quote(schedule_, s.occupant->category(), *s.billedDurationUnits);
}

void SlotPool::confirmPayment(const SlotHandle& h) {
    Slot& s = slotFor_(h);
    std::lock_guard<std::mutex> lk(s.mu);
    if (!holds_nolock(s, h) || s.state != SlotState::Occupied)
        throw NotOccupied("Slot " + std::to_string(h.slot()) +
                          " is not awaiting payment for ticket " +
                          std::to_string(h.ticket()));
    s.state = SlotState::Paid;
    s.settling = false;
}

bool SlotPool::claimSettlement(const SlotHandle& h) {
    Slot& s = slotFor_(h);
    std::lock_guard<std::mutex> lk(s.mu);
    if (!holds_nolock(s, h) || s.state != SlotState::Occupied)
        throw NotOccupied("Slot " + std::to_string(h.slot()) +
                          " is not awaiting payment for ticket " +
                          std::to_string(h.ticket()));
    if (s.settling) return false;
    s.settling = true;
    return true;
}

void SlotPool::abandonSettlement(const SlotHandle& h) {
    Slot& s = slotFor_(h);
    std::lock_guard<std::mutex> lk(s.mu);
    if (holds_nolock(s, h) && s.state == SlotState::Occupied) s.settling = false;
}

bool SlotPool::settling(const SlotHandle& h) const {
    const Slot& s = slotFor_(h);
    std::lock_guard<std::mutex> lk(s.mu);
    return holds_nolock(s, h) && s.settling;
}

ReleaseStatus SlotPool::release(const SlotHandle& h) {
    Slot& s = slotFor_(h);
    std::lock_guard<std::mutex> lk(s.mu);
    if (!holds_nolock(s, h)) return ReleaseStatus::Released; // already gone
    if (s.state != SlotState::Paid) return ReleaseStatus::PaymentRequired;

    s.state = SlotState::Free;
    s.occupant.reset();
    s.billedDurationUnits.reset();
    s.ticket = 0;
    s.settling = false;
    return ReleaseStatus::Released;
}

SlotState SlotPool::state(const SlotHandle& h) const {
    const Slot& s = slotFor_(h);
    std::lock_guard<std::mutex> lk(s.mu);
    return holds_nolock(s, h) ? s.state : SlotState::Free;
}

std::optional<Vehicle> SlotPool::occupant(const SlotHandle& h) const {
    const Slot& s = slotFor_(h);
    std::lock_guard<std::mutex> lk(s.mu);
    if (!holds_nolock(s, h)) return std::nullopt;
    return s.occupant;
}

Occupancy SlotPool::occupancy() const {
    Occupancy o;
    o.total = slots_.size();
    for (const auto& s : slots_) {
        std::lock_guard<std::mutex> lk(s.mu);
        switch (s.state) {
            case SlotState::Free:     ++o.free; break;
            case SlotState::Occupied: ++o.occupied; break;
            case SlotState::Paid:     ++o.paid; break;
        }
    }
    return o;
}

SlotPool::Slot& SlotPool::slotFor_(const SlotHandle& h) {
    if (h.slot() >= slots_.size())
        throw InvalidHandle("Slot " + std::to_string(h.slot()) +
                            " is outside a pool of " + std::to_string(slots_.size()));
    return slots_[h.slot()];
}

const SlotPool::Slot& SlotPool::slotFor_(const SlotHandle& h) const {
    if (h.slot() >= slots_.size())
        throw InvalidHandle("Slot " + std::to_string(h.slot()) +
                            " is outside a pool of " + std::to_string(slots_.size()));
    return slots_[h.slot()];
}

} // namespace parkpool
