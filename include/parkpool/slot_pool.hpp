#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

#include "parkpool/fee_policy.hpp"
#include "parkpool/vehicle.hpp"

namespace parkpool {

using TicketId = unsigned long long;

enum class SlotState { Free, Occupied, Paid };
enum class ReleaseStatus { Released, PaymentRequired };

const char* toString(SlotState s);
const char* toString(ReleaseStatus s);

// Capability to act on one occupancy of one Slot. Only SlotPool::allocate
// hands these out. Tickets are unique across every pool in the process, so a
// handle never matches an occupancy it was not issued for. Once the
// occupancy is released the handle goes stale.
class SlotHandle {
public:
    std::size_t slot() const { return slot_; }
    TicketId ticket() const { return ticket_; }

private:
    friend class SlotPool;
    SlotHandle(std::size_t slot, TicketId ticket) : slot_(slot), ticket_(ticket) {}

    std::size_t slot_;
    TicketId ticket_;
};

struct Occupancy {
    std::size_t free = 0;
    std::size_t occupied = 0;
    std::size_t paid = 0;
    std::size_t total = 0;
};

// Fixed-capacity pool of homogeneous slots.
//
// Every Slot carries its own mutex; allocate() walks the slots in order and
// holds at most one slot lock at a time, so unrelated slots never block each
// other and two allocations can never claim the same slot.
//
// Lifecycle per slot: Free --allocate--> Occupied --confirmPayment--> Paid
// --release--> Free. release() on an Occupied slot is refused with
// ReleaseStatus::PaymentRequired and changes nothing.
class SlotPool {
public:
    explicit SlotPool(std::size_t capacity, FeeSchedule schedule = {});
    SlotPool(const SlotPool&) = delete;
    SlotPool& operator=(const SlotPool&) = delete;

    // First free slot in pool order, or nullopt when the lot is full.
    // Throws InvalidCategory or FeeOverflow before touching any slot if the
    // occupancy could not be priced.
    std::optional<SlotHandle> allocate(const Vehicle& vehicle,
                                       unsigned long long durationUnits);

    // Fee for the occupancy; duration is frozen at allocation. Throws
    // NotOccupied for a stale handle.
    Amount quoteFee(const SlotHandle& h) const;

    // Occupied -> Paid, dropping any settlement claim. Throws NotOccupied
    // otherwise, including a second confirmation of the same occupancy.
    void confirmPayment(const SlotHandle& h);

    // Reserve the right to charge this occupancy. Returns false when another
    // caller already holds the claim. Throws NotOccupied unless Occupied.
    bool claimSettlement(const SlotHandle& h);
    // Give a claim back after a failed charge. No-op once the occupancy is
    // Paid or gone.
    void abandonSettlement(const SlotHandle& h);
    bool settling(const SlotHandle& h) const;

    // Paid -> Free. Occupied stays put and reports PaymentRequired. A slot
    // the handle no longer holds reports Released without doing anything.
    ReleaseStatus release(const SlotHandle& h);

    // State of the handle's occupancy; Free once it has been released.
    SlotState state(const SlotHandle& h) const;
    std::optional<Vehicle> occupant(const SlotHandle& h) const;

    std::size_t capacity() const { return slots_.size(); }
    // Counted slot by slot; not a single atomic snapshot while other threads
    // are allocating or releasing.
    Occupancy occupancy() const;
    const FeeSchedule& schedule() const { return schedule_; }

private:
    struct Slot {
        SlotState state = SlotState::Free;
        std::optional<Vehicle> occupant;
        std::optional<unsigned long long> billedDurationUnits;
        TicketId ticket = 0; // 0 while Free; never issued
        bool settling = false; // a charge is in flight, only while Occupied
        mutable std::mutex mu;
    };

    Slot& slotFor_(const SlotHandle& h);
    const Slot& slotFor_(const SlotHandle& h) const;
    static bool holds_nolock(const Slot& s, const SlotHandle& h) {
        return s.state != SlotState::Free && s.ticket == h.ticket();
    }

    const FeeSchedule schedule_;
    std::vector<Slot> slots_;
};

} // namespace parkpool
