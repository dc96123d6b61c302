#include "rxpos/domain/cart.hpp"
#include "rxpos/domain/money.hpp"

#include <algorithm>

namespace rxpos {
namespace domain {

void CartLine::recompute() {
  total_price = money::round2(quantity * unit_price);
}

CartLine makeCartLine(const MedicineRecord& medicine, int quantity) {
  CartLine line;
  line.medicine_id = medicine.id;
  line.name = medicine.name;
  line.quantity = quantity;
  line.unit_price = medicine.selling_price;
  line.batch_no = medicine.batch_no;
  line.recompute();
  return line;
}

CartTotals computeTotals(const Cart& cart) {
  double raw_subtotal = 0.0;
  for (const auto& line : cart.lines) {
    raw_subtotal += line.total_price;
  }

  CartTotals totals;
  totals.subtotal = money::round2(raw_subtotal);
  totals.discount = std::min(cart.discount, totals.subtotal);

  // Not rounded on purpose: the tax and total steps round their own results.
  double discounted = totals.subtotal - totals.discount;

  totals.tax = money::round2(discounted * (cart.tax_rate_percent / 100.0));
  totals.total = money::round2(discounted + totals.tax);
  return totals;
}

CartSummary summarize(const Cart& cart) {
  CartSummary summary;
  summary.item_count = cart.lines.size();
  for (const auto& line : cart.lines) {
    summary.total_quantity += line.quantity;
  }
  summary.totals = computeTotals(cart);
  summary.tax_rate_percent = cart.tax_rate_percent;
  summary.payment_method = cart.payment_method;
  summary.lines = cart.lines;
  return summary;
}

}  // namespace domain
}  // namespace rxpos
