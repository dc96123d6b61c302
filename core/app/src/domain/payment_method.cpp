#include "rxpos/domain/payment_method.hpp"

namespace rxpos {
namespace domain {

const char* toString(PaymentMethod method) {
  switch (method) {
    case PaymentMethod::Cash:         return "cash";
    case PaymentMethod::Card:         return "card";
    case PaymentMethod::Upi:          return "upi";
    case PaymentMethod::Cheque:       return "cheque";
    case PaymentMethod::BankTransfer: return "bank_transfer";
  }
  return "cash";
}

std::optional<PaymentMethod> parsePaymentMethod(const std::string& token) {
  for (PaymentMethod method : kAllPaymentMethods) {
    if (token == toString(method)) {
      return method;
    }
  }
  return std::nullopt;
}

std::string paymentMethodList() {
  std::string out;
  for (PaymentMethod method : kAllPaymentMethods) {
    if (!out.empty()) {
      out += ", ";
    }
    out += toString(method);
  }
  return out;
}

}  // namespace domain
}  // namespace rxpos
