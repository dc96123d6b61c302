#pragma once

#include "rxpos/domain/cart.hpp"
#include "rxpos/domain/errors.hpp"
#include "rxpos/domain/medicine.hpp"

#include <mutex>
#include <string>

namespace rxpos {

// -----------------------------------------------------------------------------
// CartEngine: the in-progress sale of one till session
// -----------------------------------------------------------------------------
//
// @brief  Holds the session's Cart and enforces its invariants on every
//         mutation. Computes totals on demand.
//
// @details
// CartEngine never touches storage. Operations that need stock figures
// (addItem, updateQuantity) take the caller's latest MedicineRecord snapshot
// as an argument; the session layer (PosEngine) fetches it from the medicine
// repository just before the call. The authoritative stock check happens
// later, at commit, through the repository's conditional decrement.
//
// Every mutator is all-or-nothing: on error the cart is exactly as it was.
//
// Invariants after any successful call:
//   - lines unique by medicine_id, in first-added order
//   - every line has quantity > 0 and total_price == round2(qty * unit_price)
//   - 0 <= discount <= current subtotal
//   - 0 <= tax_rate_percent <= 100
//
// Thread model:
//   One till session normally drives its cart from a single thread, but the
//   IPC server thread and the main thread can both reach the session, so
//   each public call holds mutex_ for its (short, I/O-free) duration.
//
// Ownership:
//   Owned by PosEngine (one per session). SaleCommitProtocol receives it by
//   reference for the duration of complete().
// -----------------------------------------------------------------------------
class CartEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  default_tax_rate  Rate applied to a fresh cart and re-applied by
  //                           clear(). Clamped into [0, 100].
  // -------------------------------------------------------------------------
  explicit CartEngine(double default_tax_rate = 0.0);

  CartEngine(const CartEngine&) = delete;
  CartEngine& operator=(const CartEngine&) = delete;
  CartEngine(CartEngine&&) = delete;
  CartEngine& operator=(CartEngine&&) = delete;

  // -------------------------------------------------------------------------
  // addItem(medicine_id, requested_qty, current_stock)
  // -------------------------------------------------------------------------
  //
  // @brief  Adds units of a medicine, merging into an existing line.
  //
  // @param  medicine_id    Medicine to add. Must match current_stock.id.
  // @param  requested_qty  Units to add; must be > 0.
  // @param  current_stock  Latest known record for the medicine.
  //
  // @return The resulting line (new or merged) on success.
  //
  // @details
  // Failures (cart unchanged):
  //   InvalidQuantity  : requested_qty <= 0
  //   NotFound         : current_stock.id does not match medicine_id
  //   InsufficientStock: current_stock.quantity < resulting line quantity;
  //                       `requested` reports the resulting line quantity.
  //
  // A merged line keeps the unit_price captured when it was first added.
  // -------------------------------------------------------------------------
  Result<domain::CartLine> addItem(domain::MedicineId medicine_id,
                                   int requested_qty,
                                   const domain::MedicineRecord& current_stock);

  // NotFound if the medicine has no line in the cart.
  Status removeItem(domain::MedicineId medicine_id);

  // -------------------------------------------------------------------------
  // updateQuantity(medicine_id, new_qty, current_stock)
  // -------------------------------------------------------------------------
  // Sets a line's quantity outright. new_qty <= 0 behaves exactly like
  // removeItem(). Otherwise NotFound if absent, InsufficientStock if
  // current_stock.quantity < new_qty.
  // -------------------------------------------------------------------------
  Status updateQuantity(domain::MedicineId medicine_id, int new_qty,
                        const domain::MedicineRecord& current_stock);

  // NegativeValue if amount < 0; ExceedsSubtotal if amount > subtotal.
  Status setDiscount(double amount);

  // TaxRateOutOfRange unless 0 <= percent <= 100.
  Status setTaxRate(double percent);

  Status setPaymentMethod(domain::PaymentMethod method);

  // Parses the wire token first; InvalidPaymentMethod if unknown.
  Status setPaymentMethod(const std::string& token);

  // Pure; two calls with no mutation in between return identical values.
  domain::CartTotals totals() const;

  domain::CartSummary summary() const;

  // Copy of the current Cart value object.
  domain::Cart snapshot() const;

  // -------------------------------------------------------------------------
  // clear()
  // -------------------------------------------------------------------------
  // Drops all lines, resets discount to 0, payment method to cash, and the
  // tax rate to the session default.
  // -------------------------------------------------------------------------
  void clear();

  bool empty() const;
  std::size_t lineCount() const;

  // Replaces the session default rate; also applied immediately when the
  // cart is empty (a new transaction has not started yet).
  void setDefaultTaxRate(double percent);

 private:
  // Index of the line for medicine_id, or lines_.size() if absent.
  // Caller must hold mutex_.
  std::size_t findLine(domain::MedicineId medicine_id) const;

  // Subtotal as computeTotals() would report it. Caller must hold mutex_.
  double subtotalLocked() const;

  Status removeItemLocked(domain::MedicineId medicine_id);
  void clearLocked();

  mutable std::mutex mutex_;
  domain::Cart cart_;
  double default_tax_rate_{0.0};
};

}  // namespace rxpos
