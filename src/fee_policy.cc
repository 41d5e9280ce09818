#include "parkpool/fee_policy.hpp"

#include <limits>
#include <string>

#include "parkpool/errors.hpp"

namespace parkpool {

Amount FeeSchedule::rate(Category c) const {
    switch (c) {
        case Category::Bike:  return bike;
        case Category::Car:   return car;
        case Category::Truck: return truck;
    }
    // Never price an unknown category at zero.
    throw InvalidCategory("No rate for vehicle category " +
                          std::to_string(static_cast<int>(c)));
}

void validate(const FeeSchedule& s) {
    if (!(s.bike < s.car && s.car < s.truck))
        throw ConfigError("Rates must satisfy Bike < Car < Truck (got " +
                          std::to_string(s.bike) + "/" + std::to_string(s.car) +
                          "/" + std::to_string(s.truck) + ")");
}

Amount quote(const FeeSchedule& schedule, Category category,
             unsigned long long durationUnits) {
    Amount r = schedule.rate(category);
    if (r != 0 && durationUnits > std::numeric_limits<Amount>::max() / r)
        throw FeeOverflow(std::to_string(durationUnits) + " units at " +
                          std::to_string(r) + "/unit overflows the fee");
    return r * durationUnits;
}

} // namespace parkpool
