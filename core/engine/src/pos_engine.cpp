#include "rxpos/engine/pos_engine.hpp"
#include "rxpos/domain/json_codec.hpp"
#include "rxpos/domain/money.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <utility>

namespace rxpos {

namespace {

using nlohmann::json;

json errorReply(const PosError& e) {
  json j;
  j["status"] = "error";
  j["kind"] = toString(e.kind);
  j["message"] = e.message;

  if (e.kind == ErrorKind::InsufficientStock) {
    j["available"] = e.available;
    j["requested"] = e.requested;
  }
  if (e.kind == ErrorKind::ValidationFailed) {
    j["errors"] = e.validation_errors;
  }
  if (e.medicine_id) {
    j["medicine_id"] = *e.medicine_id;
  }
  if (e.sale_id) {
    j["sale_id"] = *e.sale_id;
  }
  return j;
}

json invalidRequest(const std::string& message) {
  return json{{"status", "error"},
              {"kind", "invalid_request"},
              {"message", message}};
}

json okReply() { return json{{"status", "ok"}}; }

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
PosEngine::PosEngine(StoreConfig config, const ITimeProvider& clock)
    : config_(std::move(config)),
      clock_(clock),
      cart_(config_.default_tax_rate) {
  db_ = std::make_unique<storage::Database>(config_.database_path);
  db_->createSchema();

  medicines_ = std::make_unique<SqliteMedicineRepository>(*db_, clock_);
  sales_ = std::make_unique<SqliteSaleRepository>(*db_);
  protocol_ = std::make_unique<SaleCommitProtocol>(
      *sales_, *medicines_, clock_, &event_bus_, medicines_.get(),
      config_.low_stock_threshold);
}

PosEngine::~PosEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void PosEngine::start() {
  if (running_) {
    return;
  }

  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& request) { return executeCommand(request); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    ipc_server_->start();

    // Telemetry bridges: bus → IPC queue (publishing thread never blocks).
    // The server pointer is captured by value; the unique_ptr itself is only
    // touched by start()/stop().
    IpcServer* server = ipc_server_.get();
    telemetry_subscriptions_.push_back(
        event_bus_.subscribe<SaleCompletedEvent>(
            [server](const SaleCompletedEvent& e) {
              server->pushTelemetry(e);
            }));
    telemetry_subscriptions_.push_back(event_bus_.subscribe<StockAlertEvent>(
        [server](const StockAlertEvent& e) { server->pushTelemetry(e); }));
    telemetry_subscriptions_.push_back(event_bus_.subscribe<LowStockEvent>(
        [server](const LowStockEvent& e) { server->pushTelemetry(e); }));
  }

  running_ = true;

  std::cout << "[PosEngine] started. store='" << config_.store_name
            << "' db=" << config_.database_path
            << " ipc=" << (ipc_server_ ? "on" : "off") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void PosEngine::stop() {
  if (!running_) {
    return;
  }

  // Join the IPC thread first, outside the session lock: a command it is
  // running may hold that lock and still be publishing telemetry.
  if (ipc_server_) {
    ipc_server_->stop();
  }

  {
    // Publishes from other threads happen under the session lock, so once it
    // is held no bridge callback is in flight.
    std::lock_guard lock(session_mutex_);
    for (auto id : telemetry_subscriptions_) {
      event_bus_.unsubscribe(id);
    }
    telemetry_subscriptions_.clear();
    ipc_server_.reset();
  }

  running_ = false;
  std::cout << "[PosEngine] stopped.\n";
}

// -----------------------------------------------------------------------------
// Session operations
// -----------------------------------------------------------------------------
Result<domain::CartLine> PosEngine::addToCart(domain::MedicineId medicine_id,
                                              int quantity) {
  std::lock_guard lock(session_mutex_);

  if (quantity <= 0) {
    return Result<domain::CartLine>::failure(
        PosError::invalidQuantity(quantity));
  }

  auto medicine = medicines_->findById(medicine_id);
  if (!medicine.ok()) {
    return Result<domain::CartLine>::failure(*medicine.error);
  }
  return cart_.addItem(medicine_id, quantity, *medicine.value);
}

Status PosEngine::removeFromCart(domain::MedicineId medicine_id) {
  std::lock_guard lock(session_mutex_);
  return cart_.removeItem(medicine_id);
}

Status PosEngine::updateCartQuantity(domain::MedicineId medicine_id,
                                     int quantity) {
  std::lock_guard lock(session_mutex_);

  if (quantity <= 0) {
    return cart_.removeItem(medicine_id);
  }

  auto medicine = medicines_->findById(medicine_id);
  if (!medicine.ok()) {
    return *medicine.error;
  }
  return cart_.updateQuantity(medicine_id, quantity, *medicine.value);
}

Status PosEngine::setDiscount(double amount) {
  std::lock_guard lock(session_mutex_);
  return cart_.setDiscount(amount);
}

Status PosEngine::setTaxRate(double percent) {
  std::lock_guard lock(session_mutex_);
  return cart_.setTaxRate(percent);
}

Status PosEngine::setPaymentMethod(const std::string& method) {
  std::lock_guard lock(session_mutex_);
  return cart_.setPaymentMethod(method);
}

domain::CartSummary PosEngine::cartSummary() const {
  std::lock_guard lock(session_mutex_);
  return cart_.summary();
}

void PosEngine::clearCart() {
  std::lock_guard lock(session_mutex_);
  cart_.clear();
}

Result<domain::SaleRecord> PosEngine::completeSale(
    std::optional<domain::CashierId> cashier_id,
    std::optional<std::string> customer_name) {
  std::lock_guard lock(session_mutex_);
  return protocol_->complete(cart_, cashier_id, std::move(customer_name));
}

Result<std::vector<domain::MedicineRecord>> PosEngine::searchProducts(
    const std::string& query) {
  auto found = medicines_->search(query);
  if (!found.ok()) {
    return found;
  }
  auto& rows = *found.value;
  rows.erase(std::remove_if(rows.begin(), rows.end(),
                            [](const domain::MedicineRecord& m) {
                              return m.quantity <= 0;
                            }),
             rows.end());
  return found;
}

// -----------------------------------------------------------------------------
// executeCommand(): JSON request → JSON reply
// -----------------------------------------------------------------------------
std::string PosEngine::executeCommand(const std::string& request) {
  json req;
  try {
    req = json::parse(request);
  } catch (const json::parse_error& e) {
    return invalidRequest(std::string("Malformed JSON: ") + e.what()).dump();
  }
  if (!req.is_object() || !req.contains("cmd") || !req["cmd"].is_string()) {
    return invalidRequest("Request must be an object with a string 'cmd'")
        .dump();
  }

  const std::string cmd = req["cmd"].get<std::string>();
  json reply;

  // Appends the cart state to a success reply, or turns a failed Status
  // into an error reply.
  auto withCart = [this](const Status& status) {
    if (status) {
      return errorReply(*status);
    }
    json j = okReply();
    j["cart"] = cartSummary();
    return j;
  };

  try {
    if (cmd == "ping") {
      reply = okReply();
      reply["response"] = "pong";
      reply["store"] = config_.store_name;
    } else if (cmd == "add_item") {
      auto added = addToCart(req.at("medicine_id").get<domain::MedicineId>(),
                             req.at("quantity").get<int>());
      if (!added.ok()) {
        reply = errorReply(*added.error);
      } else {
        reply = okReply();
        reply["line"] = *added.value;
        reply["cart"] = cartSummary();
      }
    } else if (cmd == "remove_item") {
      reply = withCart(
          removeFromCart(req.at("medicine_id").get<domain::MedicineId>()));
    } else if (cmd == "update_quantity") {
      reply = withCart(
          updateCartQuantity(req.at("medicine_id").get<domain::MedicineId>(),
                             req.at("quantity").get<int>()));
    } else if (cmd == "set_discount") {
      reply = withCart(setDiscount(req.at("amount").get<double>()));
    } else if (cmd == "set_tax_rate") {
      reply = withCart(setTaxRate(req.at("percent").get<double>()));
    } else if (cmd == "set_payment_method") {
      reply = withCart(setPaymentMethod(req.at("method").get<std::string>()));
    } else if (cmd == "cart") {
      domain::CartSummary summary = cartSummary();
      reply = okReply();
      reply["display_total"] = money::formatCurrency(summary.totals.total,
                                                     config_.currency_symbol);
      reply["cart"] = std::move(summary);
    } else if (cmd == "clear_cart") {
      clearCart();
      reply = withCart(std::nullopt);
    } else if (cmd == "complete") {
      std::optional<domain::CashierId> cashier;
      std::optional<std::string> customer;
      if (req.contains("cashier_id") && !req["cashier_id"].is_null()) {
        cashier = req["cashier_id"].get<domain::CashierId>();
      }
      if (req.contains("customer_name") && !req["customer_name"].is_null()) {
        customer = req["customer_name"].get<std::string>();
      }

      auto sale = completeSale(cashier, std::move(customer));
      if (sale.ok()) {
        reply = okReply();
        reply["sale"] = *sale.value;
        reply["display_total"] = money::formatCurrency(
            sale.value->total, config_.currency_symbol);
      } else {
        reply = errorReply(*sale.error);
        if (sale.error->kind == ErrorKind::StockAdjustmentFailed &&
            sale.value) {
          reply["sale"] = *sale.value;
          reply["alert"] = "sale recorded but inventory may be inconsistent";
        }
      }
    } else if (cmd == "get_sale") {
      auto sale = sales_->findById(req.at("sale_id").get<domain::SaleId>());
      if (!sale.ok()) {
        reply = errorReply(*sale.error);
      } else {
        reply = okReply();
        reply["sale"] = *sale.value;
      }
    } else if (cmd == "list_sales") {
      auto list = sales_->listByDateRange(req.at("start").get<std::string>(),
                                          req.at("end").get<std::string>());
      if (!list.ok()) {
        reply = errorReply(*list.error);
      } else {
        reply = okReply();
        reply["sales"] = *list.value;
      }
    } else if (cmd == "search") {
      auto found = searchProducts(req.value("query", std::string()));
      if (!found.ok()) {
        reply = errorReply(*found.error);
      } else {
        reply = okReply();
        reply["medicines"] = *found.value;
      }
    } else if (cmd == "low_stock") {
      auto low = medicines_->lowStock(config_.low_stock_threshold);
      if (!low.ok()) {
        reply = errorReply(*low.error);
      } else {
        reply = okReply();
        reply["threshold"] = config_.low_stock_threshold;
        reply["medicines"] = *low.value;
      }
    } else {
      reply = invalidRequest("Unknown command: " + cmd);
    }
  } catch (const json::exception& e) {
    reply = invalidRequest("Bad arguments for '" + cmd + "': " + e.what());
  }

  return reply.dump();
}

}  // namespace rxpos
