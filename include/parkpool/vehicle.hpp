#pragma once

#include <string>
#include <utility>

namespace parkpool {

enum class Category { Bike, Car, Truck };

// ---- Vehicle ----
// Registration number plus category. Immutable once built.
// The constructor stores what it is given and checks nothing; makeVehicle()
// is the validating path for outside input. SlotPool::allocate still refuses
// a category it cannot price.
class Vehicle {
public:
    Vehicle(std::string id, Category category)
        : id_(std::move(id)), category_(category) {}

    const std::string& id() const { return id_; }
    Category category() const { return category_; }

private:
    std::string id_;
    Category category_;
};

// Throws InvalidCategory for a value outside Category, InvalidVehicle for an
// empty id.
Vehicle makeVehicle(std::string id, Category category);

Category categoryFromString(const std::string& s);
const char* toString(Category c);

} // namespace parkpool
