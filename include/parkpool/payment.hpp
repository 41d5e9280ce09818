#pragma once

#include <memory>
#include <string>
#include <utility>

#include "parkpool/fee_policy.hpp"

namespace parkpool {

// ---- Payment interfaces ----
enum class PaymentMethod { Cash, Card, UPI };

struct Confirmation {
    Amount amount{};
    std::string rail;
    std::string reference;
};

// One settlement capability. settle() either returns a confirmation for the
// exact amount or throws PaymentDeclined.
struct IPaymentGate {
    virtual ~IPaymentGate() = default;
    virtual Confirmation settle(Amount amount) = 0;
    virtual const char* name() const = 0;
};

// Rail-specific inputs; each rail reads only its own field.
struct PaymentDetails {
    std::string cardNumber; // Card rail
    std::string upiVPA;     // UPI rail, "<handle>@<provider>"
};

struct CashGate : IPaymentGate {
    Confirmation settle(Amount amount) override;
    const char* name() const override { return "Cash"; }
};

// Declines when the card number is shorter than 8 characters.
struct CardGate : IPaymentGate {
    explicit CardGate(std::string cardNumber) : cardNumber_(std::move(cardNumber)) {}
    Confirmation settle(Amount amount) override;
    const char* name() const override { return "Card"; }

private:
    std::string cardNumber_;
};

// Declines when the VPA has no '@'.
struct UPIGate : IPaymentGate {
    explicit UPIGate(std::string vpa) : vpa_(std::move(vpa)) {}
    Confirmation settle(Amount amount) override;
    const char* name() const override { return "UPI"; }

private:
    std::string vpa_;
};

std::unique_ptr<IPaymentGate> makeGate(PaymentMethod m, const PaymentDetails& details);

// Throws ConfigError for anything but "Cash", "Card" or "UPI".
PaymentMethod paymentMethodFromString(const std::string& s);
const char* toString(PaymentMethod m);

} // namespace parkpool
