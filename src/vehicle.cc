#include "parkpool/vehicle.hpp"

#include "parkpool/errors.hpp"

namespace parkpool {

Vehicle makeVehicle(std::string id, Category category) {
    switch (category) {
        case Category::Bike:
        case Category::Car:
        case Category::Truck:
            break;
        default:
            throw InvalidCategory("Invalid vehicle category: " +
                                  std::to_string(static_cast<int>(category)));
    }
    if (id.empty()) throw InvalidVehicle("Vehicle id must not be empty");
    return Vehicle(std::move(id), category);
}

Category categoryFromString(const std::string& s) {
    if (s == "Bike")  return Category::Bike;
    if (s == "Car")   return Category::Car;
    if (s == "Truck") return Category::Truck;
    throw InvalidCategory("Invalid vehicle category: " + s);
}

const char* toString(Category c) {
    switch (c) {
        case Category::Bike:  return "Bike";
        case Category::Car:   return "Car";
        case Category::Truck: return "Truck";
    }
    throw InvalidCategory("Invalid vehicle category: " +
                          std::to_string(static_cast<int>(c)));
}

} // namespace parkpool
