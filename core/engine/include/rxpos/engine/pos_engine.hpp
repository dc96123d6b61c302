#pragma once

#include "rxpos/cart/cart_engine.hpp"
#include "rxpos/config/store_config.hpp"
#include "rxpos/domain/errors.hpp"
#include "rxpos/eventbus/event_bus.hpp"
#include "rxpos/network/ipc_server.hpp"
#include "rxpos/sale/sale_commit_protocol.hpp"
#include "rxpos/sale/sqlite_sale_repository.hpp"
#include "rxpos/stock/sqlite_medicine_repository.hpp"
#include "rxpos/storage/database.hpp"
#include "rxpos/time/i_time_provider.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rxpos {

// -----------------------------------------------------------------------------
// PosEngine
// -----------------------------------------------------------------------------
//
// @brief  Root object of one till: owns the database, the repositories, the
//         session cart, the commit protocol, the event bus, and the IPC
//         server, and exposes the session operations the front-end drives.
//
// @details
// Session operations look up the medicine's current record and then call
// the matching CartEngine mutator, so the cart always validates against a
// fresh stock figure. completeSale() hands the cart to SaleCommitProtocol.
//
// executeCommand() is the JSON front door used by the IPC server; it is also
// callable directly (tests construct the engine with empty endpoints and
// never open a socket).
//
// Thread model:
//   Constructed, started, stopped, and destroyed on one thread (main).
//   Between start() and stop(), session operations may arrive from main and
//   from the IPC worker thread; session_mutex_ makes each one atomic with
//   respect to the others (a lookup-then-add cannot interleave with a
//   completeSale).
//
// Ownership:
//   PosEngine
//    ├── config_           (StoreConfig, value)
//    ├── clock_            (const ITimeProvider&: non-owning)
//    ├── db_               (unique_ptr<storage::Database>)
//    ├── medicines_        (unique_ptr<SqliteMedicineRepository>)
//    ├── sales_            (unique_ptr<SqliteSaleRepository>)
//    ├── event_bus_        (EventBus, value)
//    ├── cart_             (CartEngine, value)
//    ├── protocol_         (unique_ptr<SaleCommitProtocol>)
//    └── ipc_server_       (unique_ptr<IpcServer>, only while running)
//
// Members are destroyed in reverse order: the IPC thread is joined before
// anything it could call into goes away.
// -----------------------------------------------------------------------------
class PosEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Opens config.database_path, creates the schema, and wires the
  //         components. No threads, no sockets.
  //
  // @param  clock  Source of sale dates and stock timestamps. Must outlive
  //                the engine.
  //
  // Throws storage::StorageError if the database cannot be opened or the
  // schema cannot be created.
  // -------------------------------------------------------------------------
  PosEngine(StoreConfig config, const ITimeProvider& clock);

  ~PosEngine();

  PosEngine(const PosEngine&) = delete;
  PosEngine& operator=(const PosEngine&) = delete;
  PosEngine(PosEngine&&) = delete;
  PosEngine& operator=(PosEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start() / stop()
  // -------------------------------------------------------------------------
  // start() brings up the IpcServer when both endpoints are non-empty and
  // bridges SaleCompleted/StockAlert/LowStock events to its telemetry queue.
  // stop() joins the server thread, then removes the bridges under the
  // session lock before destroying the server. Both idempotent.
  // -------------------------------------------------------------------------
  void start();
  void stop();
  bool running() const { return running_; }

  // --- Session operations ----------------------------------------------------

  // NotFound if the medicine does not exist; otherwise as CartEngine::addItem.
  Result<domain::CartLine> addToCart(domain::MedicineId medicine_id,
                                     int quantity);

  Status removeFromCart(domain::MedicineId medicine_id);

  // quantity <= 0 removes the line without a stock lookup.
  Status updateCartQuantity(domain::MedicineId medicine_id, int quantity);

  Status setDiscount(double amount);
  Status setTaxRate(double percent);
  Status setPaymentMethod(const std::string& method);

  domain::CartSummary cartSummary() const;
  void clearCart();

  Result<domain::SaleRecord> completeSale(
      std::optional<domain::CashierId> cashier_id = std::nullopt,
      std::optional<std::string> customer_name = std::nullopt);

  // Medicines matching `query` that have stock to sell (quantity > 0).
  Result<std::vector<domain::MedicineRecord>> searchProducts(
      const std::string& query);

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one JSON request from the front-end and returns the JSON
  //         reply.
  //
  // @details
  // Request: {"cmd": <name>, ...arguments}. Commands:
  //
  //   ping                                      → {"response":"pong"}
  //   add_item {medicine_id, quantity}          → line, cart
  //   remove_item {medicine_id}                 → cart
  //   update_quantity {medicine_id, quantity}   → cart
  //   set_discount {amount}                     → cart
  //   set_tax_rate {percent}                    → cart
  //   set_payment_method {method}               → cart
  //   cart                                      → cart, display_total
  //   clear_cart                                → cart
  //   complete {cashier_id?, customer_name?}    → sale, display_total
  //   get_sale {sale_id}                        → sale
  //   list_sales {start, end}                   → sales
  //   search {query}                            → medicines (in stock only)
  //   low_stock                                 → medicines at/below threshold
  //
  // Success replies carry "status":"ok". Failures carry "status":"error",
  // "kind" (ErrorKind in snake_case, or "invalid_request" for malformed
  // JSON, missing arguments, and unknown commands) and "message".
  // stock_adjustment_failed additionally carries the persisted "sale" and an
  // "alert" string.
  //
  // Thread-safety: Safe from any thread. Never throws.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  // --- Component access (tests, embedding) ----------------------------------
  SqliteMedicineRepository& medicines() { return *medicines_; }
  SqliteSaleRepository& sales() { return *sales_; }
  EventBus& eventBus() { return event_bus_; }
  CommitState lastCommitState() const { return protocol_->state(); }
  const StoreConfig& config() const { return config_; }

 private:
  StoreConfig config_;
  const ITimeProvider& clock_;

  std::unique_ptr<storage::Database> db_;
  std::unique_ptr<SqliteMedicineRepository> medicines_;
  std::unique_ptr<SqliteSaleRepository> sales_;

  EventBus event_bus_;
  CartEngine cart_;
  std::unique_ptr<SaleCommitProtocol> protocol_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::vector<EventBus::SubscriptionId> telemetry_subscriptions_;

  mutable std::mutex session_mutex_;
  bool running_{false};
};

}  // namespace rxpos
