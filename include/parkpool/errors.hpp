#pragma once

#include <stdexcept>
#include <string>

namespace parkpool {

// Base of every error raised by parkpool. Callers may catch this to handle
// any lot failure, or one of the concrete types below.
struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct InvalidCategory : Error {
    using Error::Error;
};

struct InvalidVehicle : Error {
    using Error::Error;
};

// Slot is not awaiting payment for the occupancy the handle refers to.
struct NotOccupied : Error {
    using Error::Error;
};

struct InvalidHandle : Error {
    using Error::Error;
};

struct PaymentDeclined : Error {
    using Error::Error;
};

// Another checkout already holds the slot's settlement claim.
struct SettlementInProgress : Error {
    using Error::Error;
};

// The gate confirmed a different amount than was quoted. Money may have
// moved, so the slot keeps its settlement claim until confirmPayment().
struct SettlementMismatch : Error {
    using Error::Error;
};

// rate * duration does not fit in an Amount.
struct FeeOverflow : Error {
    using Error::Error;
};

struct ConfigError : Error {
    using Error::Error;
};

} // namespace parkpool
