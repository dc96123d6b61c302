#pragma once

#include "rxpos/cart/cart_engine.hpp"
#include "rxpos/domain/cart.hpp"
#include "rxpos/domain/errors.hpp"
#include "rxpos/domain/sale_record.hpp"
#include "rxpos/eventbus/event_bus.hpp"
#include "rxpos/sale/i_sale_store.hpp"
#include "rxpos/stock/i_medicine_stock.hpp"
#include "rxpos/time/i_time_provider.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace rxpos {

// -----------------------------------------------------------------------------
// CommitState
// -----------------------------------------------------------------------------
// Progress of the most recent commit attempt:
//
//   Idle → Validating → Persisting → AdjustingStock → Done
//               │            │              │
//               └────────────┴──────────────┴──→ Failed
// -----------------------------------------------------------------------------
enum class CommitState {
  Idle,
  Validating,
  Persisting,
  AdjustingStock,
  Done,
  Failed,
};

const char* toString(CommitState state);

// -----------------------------------------------------------------------------
// SaleCommitProtocol
// -----------------------------------------------------------------------------
//
// @brief  Turns a cart into a persisted SaleRecord and decremented stock,
//         with a defined outcome at every failure point.
//
// @details
// Steps of complete():
//
//   1. Validating      EmptyCart if there are no lines. Totals come from
//                      computeTotals(). The candidate record is dated by the
//                      injected clock; the customer name is trimmed and a
//                      blank name is dropped. SaleRecord::validate() failures
//                      → ValidationFailed. Nothing has been written.
//
//   2. Persisting      ISaleStore::save(). Failure → PersistFailed. Nothing
//                      has been written and the cart is untouched, so the
//                      caller may simply try again.
//
//   3. AdjustingStock  checkAndDecrement() for each line in cart order. The
//                      first refusal or error stops the loop:
//                        - the sale stays persisted
//                        - decrements already applied stay applied
//                        - the result carries BOTH the persisted record and
//                          StockAdjustmentFailed{sale_id, medicine_id}
//                        - the cart is NOT cleared
//                        - StockAlertEvent is published and a [StockAlert]
//                          line goes to std::cerr
//                      This path is never retried automatically: retrying
//                      would record the sale twice.
//
//   4. Done            cart cleared, SaleCompletedEvent published, then a
//                      LowStockEvent for every sold medicine now at or below
//                      the low-stock threshold.
//
// There is no stock pre-check before step 2; the conditional decrement in
// step 3 is the only authoritative stock test.
//
// commit() runs steps 1-3 on a Cart value and never touches a CartEngine.
//
// Thread model:
//   Calls are serialized by commit_mutex_, so two threads completing at once
//   run one after the other. state() may be read from any thread.
//
// Ownership:
//   Borrows the store, stock, clock, and (optional) bus and lookup; all must
//   outlive the protocol. PosEngine owns one instance per session.
// -----------------------------------------------------------------------------
class SaleCommitProtocol {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  bus                  Receives SaleCompleted/StockAlert/LowStock
  //                              events. May be null.
  // @param  lookup               Used after a successful sale to read the
  //                              remaining stock of each sold medicine. May
  //                              be null (no low-stock events then).
  // @param  low_stock_threshold  quantity <= threshold counts as low.
  // -------------------------------------------------------------------------
  SaleCommitProtocol(ISaleStore& store, IMedicineStock& stock,
                     const ITimeProvider& clock, EventBus* bus = nullptr,
                     IMedicineLookup* lookup = nullptr,
                     int low_stock_threshold = 10);

  SaleCommitProtocol(const SaleCommitProtocol&) = delete;
  SaleCommitProtocol& operator=(const SaleCommitProtocol&) = delete;

  // Full protocol against a live cart (steps 1-4).
  Result<domain::SaleRecord> complete(
      CartEngine& cart,
      std::optional<domain::CashierId> cashier_id = std::nullopt,
      std::optional<std::string> customer_name = std::nullopt);

  // Steps 1-3 on a cart value. Publishes StockAlertEvent on the alarm path;
  // never publishes SaleCompletedEvent.
  Result<domain::SaleRecord> commit(
      const domain::Cart& cart,
      std::optional<domain::CashierId> cashier_id = std::nullopt,
      std::optional<std::string> customer_name = std::nullopt);

  CommitState state() const { return state_.load(); }

  void setLowStockThreshold(int threshold) { low_stock_threshold_ = threshold; }

 private:
  Result<domain::SaleRecord> commitLocked(
      const domain::Cart& cart, std::optional<domain::CashierId> cashier_id,
      std::optional<std::string> customer_name);

  Result<domain::SaleRecord> fail(PosError error);

  void notifyLowStock(const domain::SaleRecord& sale);

  ISaleStore& store_;
  IMedicineStock& stock_;
  const ITimeProvider& clock_;
  EventBus* bus_;
  IMedicineLookup* lookup_;
  std::atomic<int> low_stock_threshold_;

  std::mutex commit_mutex_;
  std::atomic<CommitState> state_{CommitState::Idle};
};

}  // namespace rxpos
