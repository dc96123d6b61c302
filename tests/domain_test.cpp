// =============================================================================
// domain_test.cpp
// =============================================================================
// Unit tests for the value types and helpers under rxpos/domain and
// rxpos/time: payment method tokens, calendar helpers, MedicineRecord and
// SaleRecord validation, computeTotals, and the error factories.
// =============================================================================

#include "rxpos/domain/cart.hpp"
#include "rxpos/domain/errors.hpp"
#include "rxpos/domain/medicine.hpp"
#include "rxpos/domain/payment_method.hpp"
#include "rxpos/domain/sale_record.hpp"
#include "rxpos/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace {

bool contains(const std::vector<std::string>& errors, const std::string& text) {
  return std::any_of(errors.begin(), errors.end(), [&](const std::string& e) {
    return e.find(text) != std::string::npos;
  });
}

rxpos::domain::MedicineRecord validMedicine() {
  rxpos::domain::MedicineRecord m;
  m.name = "Paracetamol 500mg";
  m.category = "Analgesic";
  m.batch_no = "PCM-2024-01";
  m.expiry_date = "2026-12-31";
  m.quantity = 100;
  m.purchase_price = 1.20;
  m.selling_price = 2.00;
  return m;
}

}  // namespace

// =============================================================================
// PaymentMethod
// =============================================================================

TEST(PaymentMethodTest, TokensRoundTrip) {
  for (auto method : rxpos::domain::kAllPaymentMethods) {
    auto parsed = rxpos::domain::parsePaymentMethod(
        rxpos::domain::toString(method));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, method);
  }
}

TEST(PaymentMethodTest, ParsingIsExact) {
  EXPECT_FALSE(rxpos::domain::parsePaymentMethod("Cash").has_value());
  EXPECT_FALSE(rxpos::domain::parsePaymentMethod("").has_value());
  EXPECT_FALSE(rxpos::domain::parsePaymentMethod("bitcoin").has_value());
  EXPECT_EQ(*rxpos::domain::parsePaymentMethod("bank_transfer"),
            rxpos::domain::PaymentMethod::BankTransfer);
}

TEST(PaymentMethodTest, ListNamesEveryMethod) {
  std::string list = rxpos::domain::paymentMethodList();
  EXPECT_NE(list.find("cash"), std::string::npos);
  EXPECT_NE(list.find("bank_transfer"), std::string::npos);
}

// =============================================================================
// Calendar helpers
// =============================================================================

TEST(TimeUtilsTest, ValidatesIsoDates) {
  EXPECT_TRUE(rxpos::isValidIsoDate("2024-03-15"));
  EXPECT_TRUE(rxpos::isValidIsoDate("2024-02-29"));
  EXPECT_FALSE(rxpos::isValidIsoDate("2023-02-29"));
  EXPECT_FALSE(rxpos::isValidIsoDate("2024-02-30"));
  EXPECT_FALSE(rxpos::isValidIsoDate("2024-2-1"));
  EXPECT_FALSE(rxpos::isValidIsoDate("2024-13-01"));
  EXPECT_FALSE(rxpos::isValidIsoDate("15/03/2024"));
  EXPECT_FALSE(rxpos::isValidIsoDate(""));
}

TEST(TimeUtilsTest, AddDaysCrossesMonthAndYear) {
  EXPECT_EQ(rxpos::addDays("2024-02-28", 1), "2024-02-29");
  EXPECT_EQ(rxpos::addDays("2024-02-29", 1), "2024-03-01");
  EXPECT_EQ(rxpos::addDays("2024-12-31", 1), "2025-01-01");
  EXPECT_EQ(rxpos::addDays("2024-03-15", -15), "2024-02-29");
  EXPECT_EQ(rxpos::addDays("2024-03-15", 30), "2024-04-14");
  EXPECT_EQ(rxpos::addDays("not-a-date", 3), "not-a-date");
}

// 2024-03-15T12:00:00Z is the same calendar day from UTC-11 to UTC+11.
TEST(TimeUtilsTest, FormatsLocalDate) {
  constexpr std::int64_t kNoon = 1710504000000;
  EXPECT_EQ(rxpos::isoDateFromMs(kNoon), "2024-03-15");

  std::string stamp = rxpos::isoDateTimeFromMs(kNoon);
  ASSERT_EQ(stamp.size(), 19u);
  EXPECT_EQ(stamp.substr(0, 11), "2024-03-15T");
}

// =============================================================================
// MedicineRecord
// =============================================================================

TEST(MedicineRecordTest, ValidRecordHasNoErrors) {
  EXPECT_TRUE(validMedicine().validate("2024-03-15").empty());
}

TEST(MedicineRecordTest, ReportsEveryBrokenField) {
  auto m = validMedicine();
  m.name = "A";
  m.category = "";
  m.batch_no = std::string(51, 'B');
  m.quantity = -1;
  m.purchase_price = 5.0;
  m.selling_price = 4.0;
  m.barcode = "12-34";

  auto errors = m.validate("2024-03-15");
  EXPECT_TRUE(contains(errors, "at least 2 characters"));
  EXPECT_TRUE(contains(errors, "Category is required"));
  EXPECT_TRUE(contains(errors, "Batch number must be less than 50"));
  EXPECT_TRUE(contains(errors, "Quantity cannot be negative"));
  EXPECT_TRUE(contains(errors, "Selling price"));
  EXPECT_TRUE(contains(errors, "Barcode"));
}

TEST(MedicineRecordTest, ExpiryMustBeAfterToday) {
  auto m = validMedicine();
  m.expiry_date = "2024-03-15";
  EXPECT_TRUE(contains(m.validate("2024-03-15"), "future"));

  m.expiry_date = "2024-03-16";
  EXPECT_TRUE(m.validate("2024-03-15").empty());

  m.expiry_date = "2024-31-12";
  EXPECT_TRUE(contains(m.validate("2024-03-15"), "YYYY-MM-DD"));
}

TEST(MedicineRecordTest, StockPredicates) {
  auto m = validMedicine();
  m.quantity = 5;
  EXPECT_TRUE(m.canSell(5));
  EXPECT_FALSE(m.canSell(6));
  EXPECT_FALSE(m.canSell(0));
  EXPECT_TRUE(m.isLowStock(10));
  EXPECT_FALSE(m.isLowStock(4));

  m.expiry_date = "2024-03-15";
  EXPECT_TRUE(m.isExpired("2024-03-15"));
  EXPECT_FALSE(m.isExpired("2024-03-14"));
  m.expiry_date = "garbage";
  EXPECT_TRUE(m.isExpired("2024-03-14"));
}

// =============================================================================
// computeTotals / SaleRecord
// =============================================================================

TEST(CartTotalsTest, AppliesRoundingAtEachStep) {
  rxpos::domain::Cart cart;
  auto med = validMedicine();
  med.id = 1;
  med.selling_price = 8.00;
  cart.lines.push_back(rxpos::domain::makeCartLine(med, 5));
  cart.discount = 5.0;
  cart.tax_rate_percent = 10.0;

  auto t = rxpos::domain::computeTotals(cart);
  EXPECT_EQ(t.subtotal, 40.0);
  EXPECT_EQ(t.discount, 5.0);
  EXPECT_EQ(t.tax, 3.5);
  EXPECT_EQ(t.total, 38.5);
}

// A discount left over from a larger cart is clamped, never shown as more
// than the subtotal.
TEST(CartTotalsTest, ClampsStaleDiscount) {
  rxpos::domain::Cart cart;
  auto med = validMedicine();
  med.id = 1;
  med.selling_price = 2.50;
  cart.lines.push_back(rxpos::domain::makeCartLine(med, 2));
  cart.discount = 20.0;

  auto t = rxpos::domain::computeTotals(cart);
  EXPECT_EQ(t.subtotal, 5.0);
  EXPECT_EQ(t.discount, 5.0);
  EXPECT_EQ(t.total, 0.0);
}

TEST(SaleRecordTest, ValidationRules) {
  rxpos::domain::SaleRecord sale;
  auto errors = sale.validate();
  EXPECT_TRUE(contains(errors, "date is required"));
  EXPECT_TRUE(contains(errors, "at least one item"));

  sale.date = "2024-3-15";
  sale.subtotal = -1.0;
  errors = sale.validate();
  EXPECT_TRUE(contains(errors, "YYYY-MM-DD"));
  EXPECT_TRUE(contains(errors, "Subtotal cannot be negative"));
}

TEST(SaleRecordTest, NonFiniteAmountsAreRejected) {
  rxpos::domain::SaleRecord sale;
  sale.date = "2024-03-15";
  sale.items.push_back(rxpos::domain::CartLine{});
  sale.discount = std::numeric_limits<double>::quiet_NaN();
  sale.total = std::numeric_limits<double>::infinity();

  auto errors = sale.validate();
  EXPECT_TRUE(contains(errors, "Discount must be a finite amount"));
  EXPECT_TRUE(contains(errors, "Total must be a finite amount"));
  EXPECT_FALSE(contains(errors, "Subtotal"));
}

// =============================================================================
// Errors
// =============================================================================

TEST(PosErrorTest, KindsAndFactories) {
  EXPECT_STREQ(rxpos::toString(rxpos::ErrorKind::StockAdjustmentFailed),
               "stock_adjustment_failed");
  EXPECT_TRUE(rxpos::isInvalidInput(rxpos::ErrorKind::TaxRateOutOfRange));
  EXPECT_FALSE(rxpos::isInvalidInput(rxpos::ErrorKind::InsufficientStock));

  auto e = rxpos::PosError::insufficientStock(7, 10, 12);
  EXPECT_EQ(e.kind, rxpos::ErrorKind::InsufficientStock);
  EXPECT_EQ(e.available, 10);
  EXPECT_EQ(e.requested, 12);
  EXPECT_EQ(e.message, "Insufficient stock. Available: 10, Requested: 12");

  auto alarm = rxpos::PosError::stockAdjustmentFailed(42, 7, "refused");
  ASSERT_TRUE(alarm.sale_id.has_value());
  EXPECT_EQ(*alarm.sale_id, 42);
  EXPECT_NE(alarm.message.find("inventory may be inconsistent"),
            std::string::npos);
}
