#pragma once

#include "rxpos/domain/medicine.hpp"
#include "rxpos/domain/payment_method.hpp"

#include <string>
#include <vector>

namespace rxpos {
namespace domain {

// -----------------------------------------------------------------------------
// CartLine
// -----------------------------------------------------------------------------
// Responsibility: One medicine in the in-progress sale.
//
// name, unit_price, and batch_no are snapshots taken when the medicine was
// first added; they are not re-read from the repository at commit time.
// total_price is derived: always round2(quantity * unit_price). Use
// makeCartLine() / recompute() rather than writing total_price directly.
//
// A CartLine is also the item type stored inside a SaleRecord (the sale keeps
// an immutable copy of the lines it was built from).
// -----------------------------------------------------------------------------
struct CartLine {
  MedicineId medicine_id{0};
  std::string name;
  int quantity{0};           // > 0
  double unit_price{0.0};    // >= 0, 2 decimals
  double total_price{0.0};   // round2(quantity * unit_price)
  std::string batch_no;

  // Re-derives total_price from quantity and unit_price.
  void recompute();
};

CartLine makeCartLine(const MedicineRecord& medicine, int quantity);

// -----------------------------------------------------------------------------
// CartTotals
// -----------------------------------------------------------------------------
// The four monetary figures shown on the till and stored on the sale.
// All values are already rounded to 2 decimals.
// -----------------------------------------------------------------------------
struct CartTotals {
  double subtotal{0.0};
  double discount{0.0};  // The discount actually applied (<= subtotal)
  double tax{0.0};
  double total{0.0};

  bool operator==(const CartTotals& other) const {
    return subtotal == other.subtotal && discount == other.discount &&
           tax == other.tax && total == other.total;
  }
  bool operator!=(const CartTotals& other) const { return !(*this == other); }
};

// -----------------------------------------------------------------------------
// Cart
// -----------------------------------------------------------------------------
//
// @brief  Value object describing a whole in-progress sale.
//
// @details
// The session (CartEngine) owns the live instance; snapshots of it are handed
// to the sale commit protocol so that committing never reads hidden shared
// state. Lines keep insertion order (display order) and are unique by
// medicine_id.
//
// Invariants maintained by CartEngine:
//   - discount >= 0 and discount <= subtotal after every successful mutator
//   - tax_rate_percent in [0, 100]
// -----------------------------------------------------------------------------
struct Cart {
  std::vector<CartLine> lines;
  double discount{0.0};
  double tax_rate_percent{0.0};
  PaymentMethod payment_method{PaymentMethod::Cash};

  bool empty() const { return lines.empty(); }
};

// -----------------------------------------------------------------------------
// computeTotals(cart)
// -----------------------------------------------------------------------------
//
// @brief  Pure pricing function. Same cart in, same totals out.
//
// @details
// Order of operations (each rounding step is observable in the result):
//   subtotal   = round2(sum of line.total_price)
//   discount   = min(cart.discount, subtotal)
//   discounted = subtotal - discount
//   tax        = round2(discounted * tax_rate_percent / 100)
//   total      = round2(discounted + tax)
//
// The min() clamp covers a discount that was valid when set but now exceeds
// the subtotal after lines were removed.
// -----------------------------------------------------------------------------
CartTotals computeTotals(const Cart& cart);

// -----------------------------------------------------------------------------
// CartSummary
// -----------------------------------------------------------------------------
// Read model for the till display: counts plus totals plus the lines.
// -----------------------------------------------------------------------------
struct CartSummary {
  std::size_t item_count{0};
  int total_quantity{0};
  CartTotals totals;
  double tax_rate_percent{0.0};
  PaymentMethod payment_method{PaymentMethod::Cash};
  std::vector<CartLine> lines;
};

CartSummary summarize(const Cart& cart);

}  // namespace domain
}  // namespace rxpos
