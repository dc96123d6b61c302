#pragma once

#include <array>
#include <optional>
#include <string>

namespace rxpos {
namespace domain {

// -----------------------------------------------------------------------------
// PaymentMethod
// -----------------------------------------------------------------------------
// Responsibility: The fixed set of tender types a sale may be settled with.
// The wire/storage spelling is the lower-case token returned by toString()
// ("cash", "card", "upi", "cheque", "bank_transfer"); that string is what the
// sales table stores and what the IPC front-end sends.
//
// Cash is the default for a fresh or cleared cart.
// -----------------------------------------------------------------------------
enum class PaymentMethod {
  Cash,
  Card,
  Upi,
  Cheque,
  BankTransfer,
};

inline constexpr std::array<PaymentMethod, 5> kAllPaymentMethods{
    PaymentMethod::Cash, PaymentMethod::Card, PaymentMethod::Upi,
    PaymentMethod::Cheque, PaymentMethod::BankTransfer};

// Storage/wire token for a payment method.
const char* toString(PaymentMethod method);

// Parses a storage/wire token. Exact, case-sensitive match; anything else
// (including "" and "Cash") yields std::nullopt.
std::optional<PaymentMethod> parsePaymentMethod(const std::string& token);

// "cash, card, upi, cheque, bank_transfer": used in error messages.
std::string paymentMethodList();

}  // namespace domain
}  // namespace rxpos
