#include "parkpool/config.hpp"

#include <fstream>

#include "parkpool/errors.hpp"

using json = nlohmann::json;
using namespace std;

namespace parkpool {

namespace {

const json& must(const json& j, const char* key) {
    if (!j.contains(key))
        throw ConfigError(string("Config missing key: ") + key);
    return j.at(key);
}

unsigned long long nonNegative(const json& j, const char* key) {
    const json& v = must(j, key);
    if (!v.is_number_integer())
        throw ConfigError(string("Config '") + key + "' must be an integer");
    if (v.is_number_unsigned()) return v.get<unsigned long long>();
    long long n = v.get<long long>();
    if (n < 0)
        throw ConfigError(string("Config '") + key + "' must not be negative");
    return static_cast<unsigned long long>(n);
}

string text(const json& j, const char* key) {
    const json& v = must(j, key);
    if (!v.is_string())
        throw ConfigError(string("Config '") + key + "' must be a string");
    return v.get<string>();
}

FeeSchedule parseRates(const json& jr) {
    if (!jr.is_object()) throw ConfigError("Config 'rates' must be an object");
    FeeSchedule fs;
    if (jr.contains("Bike"))  fs.bike  = nonNegative(jr, "Bike");
    if (jr.contains("Car"))   fs.car   = nonNegative(jr, "Car");
    if (jr.contains("Truck")) fs.truck = nonNegative(jr, "Truck");
    validate(fs);
    return fs;
}

VehicleSpec parseVehicle(const json& jv, size_t idx, const FeeSchedule& rates) {
    if (!jv.is_object())
        throw ConfigError("Config 'vehicles[" + to_string(idx) + "]' must be an object");

    Category cat;
    try {
        cat = categoryFromString(text(jv, "category"));
    } catch (const InvalidCategory& e) {
        throw ConfigError("vehicles[" + to_string(idx) + "]: " + e.what());
    }

    string id = text(jv, "id");
    if (id.empty())
        throw ConfigError("vehicles[" + to_string(idx) + "]: 'id' must not be empty");

    VehicleSpec vs{makeVehicle(std::move(id), cat), nonNegative(jv, "duration"),
                   PaymentMethod::Cash, PaymentDetails{}};

    if (jv.contains("payment")) {
        const json& jp = jv.at("payment");
        if (!jp.is_object())
            throw ConfigError("vehicles[" + to_string(idx) + "]: 'payment' must be an object");
        vs.method = paymentMethodFromString(text(jp, "method"));
        if (jp.contains("card")) vs.details.cardNumber = text(jp, "card");
        if (jp.contains("vpa"))  vs.details.upiVPA = text(jp, "vpa");
    }

    try {
        quote(rates, vs.vehicle.category(), vs.duration);
    } catch (const FeeOverflow& e) {
        throw ConfigError("vehicles[" + to_string(idx) + "]: 'duration' too large: " + e.what());
    }
    return vs;
}

} // namespace

SimulationConfig parseConfig(const json& j) {
    if (!j.is_object()) throw ConfigError("Config root must be an object");

    SimulationConfig cfg;
    cfg.capacity = static_cast<size_t>(nonNegative(j, "capacity"));
    if (j.contains("rates")) cfg.rates = parseRates(j.at("rates"));

    const auto& jvehicles = must(j, "vehicles");
    if (!jvehicles.is_array()) throw ConfigError("Config 'vehicles' must be an array");
    cfg.vehicles.reserve(jvehicles.size());
    for (size_t i = 0; i < jvehicles.size(); ++i)
        cfg.vehicles.push_back(parseVehicle(jvehicles[i], i, cfg.rates));
    return cfg;
}

SimulationConfig loadConfig(const string& path) {
    ifstream f(path);
    if (!f) throw ConfigError("Could not open config file: " + path);

    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw ConfigError("Could not parse config file " + path + ": " + e.what());
    }
    return parseConfig(j);
}

} // namespace parkpool
