#pragma once

#include "parkpool/vehicle.hpp"

namespace parkpool {

using Amount = unsigned long long; // whole currency units (INR)

// ---- Pricing ----
// Per-unit rate for each category. Linear in duration, no grace period.
struct FeeSchedule {
    Amount bike = 5;
    Amount car = 10;
    Amount truck = 20;

    Amount rate(Category c) const;
};

// Throws ConfigError unless bike < car < truck.
void validate(const FeeSchedule& schedule);

// Pure: same inputs always give the same amount. Throws InvalidCategory for a
// value outside Category, FeeOverflow when the amount does not fit.
Amount quote(const FeeSchedule& schedule, Category category,
             unsigned long long durationUnits);

} // namespace parkpool
