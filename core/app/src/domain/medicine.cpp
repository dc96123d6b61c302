#include "rxpos/domain/medicine.hpp"
#include "rxpos/time/time_utils.hpp"

#include <cctype>

namespace rxpos {
namespace domain {

namespace {

constexpr int kMaxQuantity = 999999;
constexpr double kMaxPrice = 999999.99;

std::string trimmed(const std::string& s) {
  std::size_t begin = 0;
  std::size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(begin, end - begin);
}

bool isAlnumBarcode(const std::string& code) {
  if (code.size() < 8 || code.size() > 20) {
    return false;
  }
  for (char c : code) {
    if (!std::isalnum(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::vector<std::string> MedicineRecord::validate(const std::string& today) const {
  std::vector<std::string> errors;

  const std::string n = trimmed(name);
  if (n.empty()) {
    errors.emplace_back("Medicine name is required");
  } else if (n.size() < 2) {
    errors.emplace_back("Medicine name must be at least 2 characters long");
  } else if (n.size() > 100) {
    errors.emplace_back("Medicine name must be less than 100 characters");
  }

  const std::string c = trimmed(category);
  if (c.empty()) {
    errors.emplace_back("Category is required");
  } else if (c.size() > 50) {
    errors.emplace_back("Category must be less than 50 characters");
  }

  const std::string b = trimmed(batch_no);
  if (b.empty()) {
    errors.emplace_back("Batch number is required");
  } else if (b.size() > 50) {
    errors.emplace_back("Batch number must be less than 50 characters");
  }

  if (expiry_date.empty()) {
    errors.emplace_back("Expiry date is required");
  } else if (!isValidIsoDate(expiry_date)) {
    errors.emplace_back("Expiry date must be in YYYY-MM-DD format");
  } else if (expiry_date <= today) {
    errors.emplace_back("Expiry date must be in the future");
  }

  if (quantity < 0) {
    errors.emplace_back("Quantity cannot be negative");
  } else if (quantity > kMaxQuantity) {
    errors.emplace_back("Quantity cannot exceed 999,999");
  }

  if (purchase_price < 0.0) {
    errors.emplace_back("Purchase price cannot be negative");
  } else if (purchase_price > kMaxPrice) {
    errors.emplace_back("Purchase price cannot exceed 999,999.99");
  }

  if (selling_price < 0.0) {
    errors.emplace_back("Selling price cannot be negative");
  } else if (selling_price > kMaxPrice) {
    errors.emplace_back("Selling price cannot exceed 999,999.99");
  }

  if (purchase_price > 0.0 && selling_price > 0.0 &&
      selling_price < purchase_price) {
    errors.emplace_back("Selling price should not be less than purchase price");
  }

  if (barcode.has_value()) {
    const std::string code = trimmed(*barcode);
    if (!code.empty() && !isAlnumBarcode(code)) {
      errors.emplace_back("Barcode must be 8-20 alphanumeric characters");
    }
  }

  return errors;
}

bool MedicineRecord::isExpired(const std::string& today) const {
  if (!isValidIsoDate(expiry_date)) {
    return true;
  }
  return expiry_date <= today;
}

}  // namespace domain
}  // namespace rxpos
