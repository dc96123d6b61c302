// =============================================================================
// pos_engine_test.cpp
// =============================================================================
// End-to-end tests for PosEngine through executeCommand(), the same JSON path
// the IPC server drives.
//
// The engine runs on an in-memory database with both IPC endpoints empty, so
// no sockets are opened; start()/stop() still run their bookkeeping.
//
// Validates:
//   - a full till session: add, adjust, discount, tax, complete
//   - error replies carry kind and the structured fields
//   - the stock-adjustment alarm returns the persisted sale
//   - search shows only medicines with stock to sell
//   - stop() on a socket-backed engine is safe while sales complete
// =============================================================================

#include "rxpos/engine/pos_engine.hpp"
#include "rxpos/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using nlohmann::json;

namespace {

constexpr std::int64_t kMarch15Noon = 1710504000000;

rxpos::StoreConfig memoryConfig() {
  rxpos::StoreConfig config;
  config.database_path = ":memory:";
  config.ipc_cmd_endpoint.clear();
  config.ipc_pub_endpoint.clear();
  config.store_name = "Test Pharmacy";
  return config;
}

}  // namespace

class PosEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    engine.eventBus().subscribe<rxpos::SaleCompletedEvent>(
        [this](const rxpos::SaleCompletedEvent&) { ++sales_completed; });
    engine.eventBus().subscribe<rxpos::StockAlertEvent>(
        [this](const rxpos::StockAlertEvent&) { ++stock_alerts; });
  }

  rxpos::domain::MedicineId seed(const std::string& name, int quantity,
                                 double price) {
    rxpos::domain::MedicineRecord m;
    m.name = name;
    m.category = "Capsule";
    m.batch_no = "L-" + name;
    m.expiry_date = "2026-09-30";
    m.quantity = quantity;
    m.purchase_price = price / 2.0;
    m.selling_price = price;
    auto added = engine.medicines().add(m);
    EXPECT_TRUE(added.ok());
    return added.ok() ? added.value->id : 0;
  }

  json send(const json& request) {
    return json::parse(engine.executeCommand(request.dump()));
  }

  rxpos::SimulationTimeProvider clock{kMarch15Noon};
  rxpos::PosEngine engine{memoryConfig(), clock};
  int sales_completed{0};
  int stock_alerts{0};
};

// -----------------------------------------------------------------------------
// 1. Liveness.
// -----------------------------------------------------------------------------
TEST_F(PosEngineTest, Ping) {
  json reply = send({{"cmd", "ping"}});
  EXPECT_EQ(reply["status"], "ok");
  EXPECT_EQ(reply["response"], "pong");
  EXPECT_EQ(reply["store"], "Test Pharmacy");
}

// -----------------------------------------------------------------------------
// 2. A whole session: two adds merge, discount and tax apply, the sale
//    completes, stock drops, the cart empties.
// -----------------------------------------------------------------------------
TEST_F(PosEngineTest, FullSaleSession) {
  auto a = seed("Doxycycline", 10, 8.00);

  json first = send({{"cmd", "add_item"}, {"medicine_id", a}, {"quantity", 3}});
  ASSERT_EQ(first["status"], "ok") << first.dump();
  EXPECT_EQ(first["line"]["total_price"], 24.0);

  json merged = send({{"cmd", "add_item"}, {"medicine_id", a}, {"quantity", 2}});
  ASSERT_EQ(merged["status"], "ok");
  EXPECT_EQ(merged["line"]["quantity"], 5);
  EXPECT_EQ(merged["cart"]["item_count"], 1);

  EXPECT_EQ(send({{"cmd", "set_discount"}, {"amount", 5.0}})["status"], "ok");
  EXPECT_EQ(send({{"cmd", "set_tax_rate"}, {"percent", 10.0}})["status"], "ok");
  EXPECT_EQ(
      send({{"cmd", "set_payment_method"}, {"method", "upi"}})["status"],
      "ok");

  json cart = send({{"cmd", "cart"}});
  EXPECT_EQ(cart["cart"]["totals"]["subtotal"], 40.0);
  EXPECT_EQ(cart["cart"]["totals"]["tax"], 3.5);
  EXPECT_EQ(cart["cart"]["totals"]["total"], 38.5);
  EXPECT_EQ(cart["display_total"], "$38.50");

  json done = send({{"cmd", "complete"},
                    {"cashier_id", 5},
                    {"customer_name", "A. Rao"}});
  ASSERT_EQ(done["status"], "ok") << done.dump();
  EXPECT_EQ(done["sale"]["total"], 38.5);
  EXPECT_EQ(done["sale"]["date"], "2024-03-15");
  EXPECT_EQ(done["sale"]["payment_method"], "upi");
  EXPECT_EQ(done["sale"]["cashier_id"], 5);
  EXPECT_EQ(done["display_total"], "$38.50");

  EXPECT_EQ(engine.lastCommitState(), rxpos::CommitState::Done);
  EXPECT_EQ(sales_completed, 1);
  EXPECT_EQ(engine.medicines().findById(a).value->quantity, 5);

  json after = send({{"cmd", "cart"}});
  EXPECT_EQ(after["cart"]["item_count"], 0);
  EXPECT_EQ(after["cart"]["payment_method"], "cash");

  json fetched = send({{"cmd", "get_sale"}, {"sale_id", done["sale"]["id"]}});
  ASSERT_EQ(fetched["status"], "ok");
  EXPECT_EQ(fetched["sale"]["customer_name"], "A. Rao");

  json listed = send(
      {{"cmd", "list_sales"}, {"start", "2024-03-15"}, {"end", "2024-03-15"}});
  ASSERT_EQ(listed["status"], "ok");
  EXPECT_EQ(listed["sales"].size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Error replies.
// -----------------------------------------------------------------------------
TEST_F(PosEngineTest, InsufficientStockReply) {
  auto a = seed("Erythromycin", 4, 3.00);

  json reply = send({{"cmd", "add_item"}, {"medicine_id", a}, {"quantity", 6}});
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["kind"], "insufficient_stock");
  EXPECT_EQ(reply["available"], 4);
  EXPECT_EQ(reply["requested"], 6);
  EXPECT_EQ(reply["medicine_id"], a);
  EXPECT_EQ(reply["message"], "Insufficient stock. Available: 4, Requested: 6");
}

TEST_F(PosEngineTest, UnknownMedicineAndSale) {
  json reply =
      send({{"cmd", "add_item"}, {"medicine_id", 777}, {"quantity", 1}});
  EXPECT_EQ(reply["kind"], "not_found");
  EXPECT_EQ(reply["medicine_id"], 777);

  json sale = send({{"cmd", "get_sale"}, {"sale_id", 31}});
  EXPECT_EQ(sale["kind"], "not_found");
  EXPECT_EQ(sale["sale_id"], 31);
}

TEST_F(PosEngineTest, InputGuards) {
  auto a = seed("Famotidine", 10, 1.00);

  EXPECT_EQ(send({{"cmd", "add_item"}, {"medicine_id", a}, {"quantity", 0}})
                ["kind"],
            "invalid_quantity");
  EXPECT_EQ(send({{"cmd", "set_discount"}, {"amount", -2.0}})["kind"],
            "negative_value");
  EXPECT_EQ(send({{"cmd", "set_discount"}, {"amount", 2.0}})["kind"],
            "exceeds_subtotal");
  EXPECT_EQ(send({{"cmd", "set_tax_rate"}, {"percent", 101}})["kind"],
            "tax_rate_out_of_range");
  EXPECT_EQ(send({{"cmd", "set_payment_method"}, {"method", "gold"}})["kind"],
            "invalid_payment_method");
  EXPECT_EQ(send({{"cmd", "remove_item"}, {"medicine_id", a}})["kind"],
            "not_found");
  EXPECT_EQ(send({{"cmd", "complete"}})["kind"], "empty_cart");
}

TEST_F(PosEngineTest, MalformedRequests) {
  EXPECT_EQ(json::parse(engine.executeCommand("{oops"))["kind"],
            "invalid_request");
  EXPECT_EQ(json::parse(engine.executeCommand("[]"))["kind"],
            "invalid_request");
  EXPECT_EQ(send({{"cmd", "teleport"}})["kind"], "invalid_request");
  EXPECT_EQ(send({{"cmd", "add_item"}, {"quantity", 1}})["kind"],
            "invalid_request");
  EXPECT_EQ(send({{"cmd", "set_discount"}, {"amount", "lots"}})["kind"],
            "invalid_request");
}

TEST_F(PosEngineTest, UpdateQuantityToZeroRemovesLine) {
  auto a = seed("Glipizide", 10, 2.00);
  auto b = seed("Hydroxyzine", 10, 3.00);
  ASSERT_EQ(send({{"cmd", "add_item"}, {"medicine_id", a}, {"quantity", 2}})
                ["status"],
            "ok");
  ASSERT_EQ(send({{"cmd", "add_item"}, {"medicine_id", b}, {"quantity", 1}})
                ["status"],
            "ok");

  json updated =
      send({{"cmd", "update_quantity"}, {"medicine_id", b}, {"quantity", 4}});
  ASSERT_EQ(updated["status"], "ok");
  EXPECT_EQ(updated["cart"]["totals"]["subtotal"], 16.0);

  json removed =
      send({{"cmd", "update_quantity"}, {"medicine_id", a}, {"quantity", 0}});
  ASSERT_EQ(removed["status"], "ok");
  EXPECT_EQ(removed["cart"]["item_count"], 1);

  json cleared = send({{"cmd", "clear_cart"}});
  EXPECT_EQ(cleared["cart"]["item_count"], 0);
}

// -----------------------------------------------------------------------------
// 4. Stock sold elsewhere between add and complete.
// Why: the reply must say the sale exists, so the operator can reconcile
//      instead of ringing it up again.
// -----------------------------------------------------------------------------
TEST_F(PosEngineTest, StockAdjustmentFailedReturnsSale) {
  auto a = seed("Isosorbide", 5, 4.00);
  ASSERT_EQ(send({{"cmd", "add_item"}, {"medicine_id", a}, {"quantity", 5}})
                ["status"],
            "ok");

  auto elsewhere = engine.medicines().checkAndDecrement(a, 1);
  ASSERT_TRUE(elsewhere.ok());
  ASSERT_TRUE(*elsewhere.value);

  json reply = send({{"cmd", "complete"}});
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["kind"], "stock_adjustment_failed");
  EXPECT_EQ(reply["medicine_id"], a);
  ASSERT_TRUE(reply.contains("sale"));
  EXPECT_EQ(reply["sale_id"], reply["sale"]["id"]);
  EXPECT_TRUE(reply["alert"].is_string());

  EXPECT_EQ(engine.lastCommitState(), rxpos::CommitState::Failed);
  EXPECT_EQ(stock_alerts, 1);
  EXPECT_EQ(sales_completed, 0);

  json fetched = send({{"cmd", "get_sale"}, {"sale_id", reply["sale_id"]}});
  EXPECT_EQ(fetched["status"], "ok");

  // The cart is kept for reconciliation.
  EXPECT_EQ(send({{"cmd", "cart"}})["cart"]["item_count"], 1);
}

// -----------------------------------------------------------------------------
// 5. Queries.
// -----------------------------------------------------------------------------
TEST_F(PosEngineTest, SearchShowsOnlySellableStock) {
  seed("Ketorolac", 6, 2.00);
  seed("Ketoconazole", 0, 5.00);

  json reply = send({{"cmd", "search"}, {"query", "keto"}});
  ASSERT_EQ(reply["status"], "ok");
  ASSERT_EQ(reply["medicines"].size(), 1u);
  EXPECT_EQ(reply["medicines"][0]["name"], "Ketorolac");

  auto direct = engine.searchProducts("keto");
  ASSERT_TRUE(direct.ok());
  EXPECT_EQ(direct.value->size(), 1u);
}

TEST_F(PosEngineTest, LowStockCommand) {
  seed("Lisinopril", 50, 1.00);
  seed("Meloxicam", 3, 1.00);

  json reply = send({{"cmd", "low_stock"}});
  ASSERT_EQ(reply["status"], "ok");
  EXPECT_EQ(reply["threshold"], 10);
  ASSERT_EQ(reply["medicines"].size(), 1u);
  EXPECT_EQ(reply["medicines"][0]["name"], "Meloxicam");
}

// -----------------------------------------------------------------------------
// 6. Lifecycle without sockets.
// -----------------------------------------------------------------------------
TEST_F(PosEngineTest, StartStopAreIdempotent) {
  EXPECT_FALSE(engine.running());
  engine.start();
  engine.start();
  EXPECT_TRUE(engine.running());

  // Session operations keep working while running.
  EXPECT_EQ(send({{"cmd", "ping"}})["status"], "ok");

  engine.stop();
  engine.stop();
  EXPECT_FALSE(engine.running());
}

// -----------------------------------------------------------------------------
// 7. Stopping a socket-backed engine while sales are being completed.
// Why: telemetry bridges run on whichever thread completes the sale; stop()
//      must not tear the server down underneath one of them.
// -----------------------------------------------------------------------------
TEST(PosEngineIpcTest, StopWhileSalesCompleteOnAnotherThread) {
  rxpos::StoreConfig config = memoryConfig();
  config.ipc_cmd_endpoint =
      "ipc://" + ::testing::TempDir() + "rxpos_engine_cmd.sock";
  config.ipc_pub_endpoint =
      "ipc://" + ::testing::TempDir() + "rxpos_engine_pub.sock";
  config.low_stock_threshold = 1000;

  rxpos::SimulationTimeProvider clock{kMarch15Noon};
  rxpos::PosEngine engine(config, clock);

  rxpos::domain::MedicineRecord m;
  m.name = "Omeprazole 20mg";
  m.category = "Capsule";
  m.batch_no = "OM-1";
  m.expiry_date = "2026-09-30";
  m.quantity = 500;
  m.purchase_price = 1.0;
  m.selling_price = 2.0;
  auto added = engine.medicines().add(m);
  ASSERT_TRUE(added.ok());
  const auto id = added.value->id;

  engine.start();
  ASSERT_TRUE(engine.running());

  std::atomic<int> completed{0};
  std::atomic<bool> done{false};
  std::atomic<bool> till_finished{false};
  std::thread till([&] {
    for (int i = 0; i < 200 && !done.load(); ++i) {
      if (!engine.addToCart(id, 1).ok()) {
        break;
      }
      if (engine.completeSale(std::nullopt, std::nullopt).ok()) {
        ++completed;
      }
    }
    till_finished = true;
  });

  while (completed.load() < 5 && !till_finished.load()) {
    std::this_thread::yield();
  }
  engine.stop();
  done = true;
  till.join();

  EXPECT_FALSE(engine.running());
  EXPECT_GE(completed.load(), 5);
}

TEST(PosEngineConfigTest, DefaultTaxRateAppliesToNewCart) {
  rxpos::StoreConfig config = memoryConfig();
  config.default_tax_rate = 7.5;
  rxpos::SimulationTimeProvider clock{kMarch15Noon};
  rxpos::PosEngine engine(config, clock);

  EXPECT_EQ(engine.cartSummary().tax_rate_percent, 7.5);
  EXPECT_EQ(engine.config().store_name, "Test Pharmacy");
}
