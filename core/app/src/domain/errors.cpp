#include "rxpos/domain/errors.hpp"
#include "rxpos/domain/money.hpp"
#include "rxpos/domain/payment_method.hpp"

namespace rxpos {

const char* toString(ErrorKind kind) {
  using K = ErrorKind;
  switch (kind) {
    case K::InvalidQuantity:       return "invalid_quantity";
    case K::NegativeValue:         return "negative_value";
    case K::ExceedsSubtotal:       return "exceeds_subtotal";
    case K::TaxRateOutOfRange:     return "tax_rate_out_of_range";
    case K::InvalidPaymentMethod:  return "invalid_payment_method";
    case K::NotFound:              return "not_found";
    case K::InsufficientStock:     return "insufficient_stock";
    case K::EmptyCart:             return "empty_cart";
    case K::ValidationFailed:      return "validation_failed";
    case K::PersistFailed:         return "persist_failed";
    case K::StockAdjustmentFailed: return "stock_adjustment_failed";
  }
  return "unknown";
}

bool isInvalidInput(ErrorKind kind) {
  using K = ErrorKind;
  return kind == K::InvalidQuantity || kind == K::NegativeValue ||
         kind == K::ExceedsSubtotal || kind == K::TaxRateOutOfRange ||
         kind == K::InvalidPaymentMethod;
}

// -----------------------------------------------------------------------------
// Factories
// -----------------------------------------------------------------------------

PosError PosError::invalidQuantity(int requested) {
  PosError e;
  e.kind = ErrorKind::InvalidQuantity;
  e.requested = requested;
  e.message = "Quantity must be positive (got " + std::to_string(requested) + ")";
  return e;
}

PosError PosError::negativeValue(const std::string& what) {
  PosError e;
  e.kind = ErrorKind::NegativeValue;
  e.message = what + " cannot be negative";
  return e;
}

PosError PosError::exceedsSubtotal(double amount, double subtotal) {
  PosError e;
  e.kind = ErrorKind::ExceedsSubtotal;
  e.message = "Discount " + money::formatCurrency(amount) +
              " cannot exceed subtotal (" + money::formatCurrency(subtotal) +
              ")";
  return e;
}

PosError PosError::taxRateOutOfRange(double percent) {
  PosError e;
  e.kind = ErrorKind::TaxRateOutOfRange;
  e.message = "Tax rate must be between 0 and 100 (got " +
              std::to_string(percent) + ")";
  return e;
}

PosError PosError::invalidPaymentMethod(const std::string& token) {
  PosError e;
  e.kind = ErrorKind::InvalidPaymentMethod;
  e.message = "Invalid payment method '" + token +
              "'. Valid options: " + domain::paymentMethodList();
  return e;
}

PosError PosError::medicineNotFound(domain::MedicineId id) {
  PosError e;
  e.kind = ErrorKind::NotFound;
  e.medicine_id = id;
  e.message = "Medicine with ID " + std::to_string(id) + " not found";
  return e;
}

PosError PosError::lineNotFound(domain::MedicineId id) {
  PosError e;
  e.kind = ErrorKind::NotFound;
  e.medicine_id = id;
  e.message = "Medicine with ID " + std::to_string(id) + " not found in cart";
  return e;
}

PosError PosError::insufficientStock(domain::MedicineId id, int available,
                                     int requested) {
  PosError e;
  e.kind = ErrorKind::InsufficientStock;
  e.medicine_id = id;
  e.available = available;
  e.requested = requested;
  e.message = "Insufficient stock. Available: " + std::to_string(available) +
              ", Requested: " + std::to_string(requested);
  return e;
}

PosError PosError::emptyCart() {
  PosError e;
  e.kind = ErrorKind::EmptyCart;
  e.message = "Cannot complete sale with empty cart";
  return e;
}

PosError PosError::validationFailed(std::vector<std::string> errors) {
  PosError e;
  e.kind = ErrorKind::ValidationFailed;
  e.message = "Sale validation failed";
  for (std::size_t i = 0; i < errors.size(); ++i) {
    e.message += (i == 0 ? ": " : "; ");
    e.message += errors[i];
  }
  e.validation_errors = std::move(errors);
  return e;
}

PosError PosError::persistFailed(const std::string& detail) {
  PosError e;
  e.kind = ErrorKind::PersistFailed;
  e.message = "Storage failure: " + detail;
  return e;
}

PosError PosError::stockAdjustmentFailed(domain::SaleId sale_id,
                                         domain::MedicineId medicine_id,
                                         const std::string& detail) {
  PosError e;
  e.kind = ErrorKind::StockAdjustmentFailed;
  e.sale_id = sale_id;
  e.medicine_id = medicine_id;
  e.message = "Sale " + std::to_string(sale_id) +
              " recorded but inventory may be inconsistent: stock for "
              "medicine " + std::to_string(medicine_id) +
              " was not decremented (" + detail + ")";
  return e;
}

}  // namespace rxpos
