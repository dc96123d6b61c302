#include "rxpos/domain/sale_record.hpp"
#include "rxpos/time/time_utils.hpp"

#include <cmath>

namespace rxpos {
namespace domain {

namespace {

void checkAmount(double value, const char* what,
                 std::vector<std::string>& errors) {
  if (!std::isfinite(value)) {
    errors.emplace_back(std::string(what) + " must be a finite amount");
  } else if (value < 0.0) {
    errors.emplace_back(std::string(what) + " cannot be negative");
  }
}

}  // namespace

std::vector<std::string> SaleRecord::validate() const {
  std::vector<std::string> errors;

  if (date.empty()) {
    errors.emplace_back("Sale date is required");
  } else if (!isValidIsoDate(date)) {
    errors.emplace_back("Sale date must be in YYYY-MM-DD format");
  }

  if (items.empty()) {
    errors.emplace_back("Sale must contain at least one item");
  }

  checkAmount(subtotal, "Subtotal", errors);
  checkAmount(discount, "Discount", errors);
  checkAmount(tax, "Tax", errors);
  checkAmount(total, "Total", errors);

  return errors;
}

int SaleRecord::totalQuantity() const {
  int units = 0;
  for (const auto& item : items) {
    units += item.quantity;
  }
  return units;
}

}  // namespace domain
}  // namespace rxpos
