#pragma once

#include <cstddef>

#include "parkpool/config.hpp"
#include "parkpool/slot_pool.hpp"

namespace parkpool {

struct SimulationReport {
    std::size_t parked = 0;     // got a slot
    std::size_t turnedAway = 0; // lot was full
    std::size_t declined = 0;   // payment failed, still parked
    std::size_t exited = 0;     // paid and released
    Amount collected = 0;
    Occupancy occupancy;        // after every vehicle thread has finished
};

// One thread per vehicle, all sharing a single pool built from cfg.
SimulationReport runSimulation(const SimulationConfig& cfg);

} // namespace parkpool
