#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "parkpool/fee_policy.hpp"
#include "parkpool/payment.hpp"
#include "parkpool/vehicle.hpp"

namespace parkpool {

// One vehicle to drive through the lot.
struct VehicleSpec {
    Vehicle vehicle;
    unsigned long long duration{};
    PaymentMethod method = PaymentMethod::Cash;
    PaymentDetails details;
};

struct SimulationConfig {
    std::size_t capacity{};
    FeeSchedule rates;
    std::vector<VehicleSpec> vehicles;
};

// Every failure (missing key, wrong type, negative number, a duration whose
// fee overflows, unknown category or payment method, unreadable file) is
// reported as ConfigError.
SimulationConfig parseConfig(const nlohmann::json& j);
SimulationConfig loadConfig(const std::string& path);

} // namespace parkpool
