#include "parkpool/simulation.hpp"

#include <atomic>
#include <memory>
#include <string>

#include "parkpool/checkout.hpp"
#include "parkpool/errors.hpp"
#include "parkpool/log.hpp"
#include "parkpool/thread_group.hpp"

using namespace std;

namespace parkpool {

namespace {

struct Counters {
    atomic<size_t> parked{0};
    atomic<size_t> turnedAway{0};
    atomic<size_t> declined{0};
    atomic<size_t> exited{0};
    atomic<Amount> collected{0};
};

void driveVehicle(shared_ptr<SlotPool> pool, const VehicleSpec& vs, Counters& c) {
    const string& id = vs.vehicle.id();

    auto h = pool->allocate(vs.vehicle, vs.duration);
    if (!h) {
        logWarn("No available slots for " + id);
        ++c.turnedAway;
        return;
    }
    ++c.parked;
    logInfo("Parked: " + id + " (" + toString(vs.vehicle.category()) + ") in slot " +
            to_string(h->slot()) + ", ticket " + to_string(h->ticket()));
    logInfo("Total fee for " + id + ": INR " + to_string(pool->quoteFee(*h)));

    // Leaving before paying must be refused.
    if (pool->release(*h) == ReleaseStatus::PaymentRequired)
        logInfo("Payment not done for " + id + "! Please pay before exit.");

    auto gate = makeGate(vs.method, vs.details);
    try {
        CheckoutResult r = checkout(*pool, *h, *gate);
        if (r.confirmation) {
            c.collected += r.amount;
            logInfo("Paid INR " + to_string(r.amount) + " via " + r.confirmation->rail +
                    " (ref " + r.confirmation->reference + ") for " + id);
        }
        if (r.status == ReleaseStatus::Released) {
            ++c.exited;
            logInfo("Vehicle " + id + " exited successfully.");
        }
    } catch (const PaymentDeclined& e) {
        ++c.declined;
        logWarn("Payment declined for " + id + ": " + e.what() +
                "; vehicle stays in slot " + to_string(h->slot()));
    }
}

} // namespace

SimulationReport runSimulation(const SimulationConfig& cfg) {
    auto pool = make_shared<SlotPool>(cfg.capacity, cfg.rates);
    logInfo("Parking lot opened with " + to_string(pool->capacity()) + " slot(s)");

    // Declared after the counters so the group joins before they go away.
    Counters c;
    ThreadGroup group;
    for (const auto& vs : cfg.vehicles)
        group.spawn("Vehicle " + vs.vehicle.id(), [pool, &vs, &c] { driveVehicle(pool, vs, c); });
    group.joinAll();

    SimulationReport r;
    r.parked = c.parked;
    r.turnedAway = c.turnedAway;
    r.declined = c.declined;
    r.exited = c.exited;
    r.collected = c.collected;
    r.occupancy = pool->occupancy();
    return r;
}

} // namespace parkpool
