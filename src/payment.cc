#include "parkpool/payment.hpp"

#include <atomic>

#include "parkpool/errors.hpp"

namespace parkpool {

namespace {

std::atomic<unsigned long long> nextReference{1};

Confirmation confirm(const char* rail, Amount amount) {
    auto ref = nextReference.fetch_add(1, std::memory_order_relaxed);
    return Confirmation{amount, rail, std::string(rail) + "-" + std::to_string(ref)};
}

} // namespace

Confirmation CashGate::settle(Amount amount) {
    return confirm(name(), amount); // always succeeds
}

Confirmation CardGate::settle(Amount amount) {
    if (cardNumber_.size() < 8)
        throw PaymentDeclined("Card declined (invalid number)");
    return confirm(name(), amount);
}

Confirmation UPIGate::settle(Amount amount) {
    if (vpa_.find('@') == std::string::npos)
        throw PaymentDeclined("UPI failed (invalid VPA)");
    return confirm(name(), amount);
}

std::unique_ptr<IPaymentGate> makeGate(PaymentMethod m, const PaymentDetails& details) {
    switch (m) {
        case PaymentMethod::Cash: return std::make_unique<CashGate>();
        case PaymentMethod::Card: return std::make_unique<CardGate>(details.cardNumber);
        case PaymentMethod::UPI:  return std::make_unique<UPIGate>(details.upiVPA);
    }
    throw ConfigError("Unknown PaymentMethod");
}

PaymentMethod paymentMethodFromString(const std::string& s) {
    if (s == "Cash") return PaymentMethod::Cash;
    if (s == "Card") return PaymentMethod::Card;
    if (s == "UPI")  return PaymentMethod::UPI;
    throw ConfigError("Invalid payment method: " + s);
}

const char* toString(PaymentMethod m) {
    switch (m) {
        case PaymentMethod::Cash: return "Cash";
        case PaymentMethod::Card: return "Card";
        case PaymentMethod::UPI:  return "UPI";
    }
    return "Unknown";
}

} // namespace parkpool
