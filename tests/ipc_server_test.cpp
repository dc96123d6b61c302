// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Tests for rxpos::IpcServer.
//
// Validates:
//   - the telemetry wire format for each Event alternative
//   - a REQ client on an ipc:// endpoint gets the handler's reply
//   - start()/stop() are idempotent
//
// PUB delivery is not asserted: a SUB socket that connects after the first
// publish misses it, which would make such a test timing-dependent.
// =============================================================================

#include "rxpos/network/ipc_server.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <string>

using nlohmann::json;
using rxpos::IpcServer;

// -----------------------------------------------------------------------------
// 1. Telemetry format.
// -----------------------------------------------------------------------------
TEST(IpcServerTelemetryTest, SaleCompleted) {
  rxpos::SaleCompletedEvent e;
  e.sale.id = 17;
  e.sale.date = "2024-03-15";
  e.sale.total = 38.5;
  e.sale.cashier_id = 3;

  json j = json::parse(IpcServer::formatTelemetry(e));
  EXPECT_EQ(j["type"], "sale_completed");
  EXPECT_EQ(j["sale"]["id"], 17);
  EXPECT_EQ(j["sale"]["date"], "2024-03-15");
  EXPECT_EQ(j["sale"]["total"], 38.5);
  EXPECT_EQ(j["sale"]["payment_method"], "cash");
  EXPECT_EQ(j["sale"]["cashier_id"], 3);
  EXPECT_TRUE(j["sale"]["customer_name"].is_null());
}

TEST(IpcServerTelemetryTest, StockAlert) {
  rxpos::StockAlertEvent e{9, 4, "Clopidogrel", 6, "refused"};

  json j = json::parse(IpcServer::formatTelemetry(e));
  EXPECT_EQ(j["type"], "stock_alert");
  EXPECT_EQ(j["sale_id"], 9);
  EXPECT_EQ(j["medicine_id"], 4);
  EXPECT_EQ(j["medicine_name"], "Clopidogrel");
  EXPECT_EQ(j["requested"], 6);
  EXPECT_EQ(j["reason"], "refused");
  EXPECT_TRUE(j["alert"].is_string());
}

TEST(IpcServerTelemetryTest, LowStock) {
  json j = json::parse(
      IpcServer::formatTelemetry(rxpos::LowStockEvent{4, "Clopidogrel", 2, 10}));
  EXPECT_EQ(j["type"], "low_stock");
  EXPECT_EQ(j["medicine_id"], 4);
  EXPECT_EQ(j["name"], "Clopidogrel");
  EXPECT_EQ(j["remaining"], 2);
  EXPECT_EQ(j["threshold"], 10);
}

// -----------------------------------------------------------------------------
// 2. Request/reply over a real socket.
// Why: the front-end only ever talks to the engine through this path.
// -----------------------------------------------------------------------------
TEST(IpcServerSocketTest, RepliesWithHandlerOutput) {
  const std::string cmd = "ipc://" + ::testing::TempDir() + "rxpos_cmd.sock";
  const std::string pub = "ipc://" + ::testing::TempDir() + "rxpos_pub.sock";

  IpcServer server(
      [](const std::string& request) { return "echo:" + request; }, cmd, pub);
  server.start();
  server.start();
  ASSERT_TRUE(server.running());

  zmq::context_t ctx(1);
  zmq::socket_t client(ctx, zmq::socket_type::req);
  client.set(zmq::sockopt::rcvtimeo, 2000);
  client.set(zmq::sockopt::linger, 0);
  client.connect(cmd);

  std::string body = R"({"cmd":"ping"})";
  client.send(zmq::buffer(body), zmq::send_flags::none);

  zmq::message_t reply;
  auto received = client.recv(reply, zmq::recv_flags::none);
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(reply.to_string(), "echo:" + body);

  server.stop();
  server.stop();
  EXPECT_FALSE(server.running());
}

TEST(IpcServerSocketTest, StopWithoutStartIsNoOp) {
  IpcServer server([](const std::string&) { return std::string(); }, "", "");
  EXPECT_NO_FATAL_FAILURE(server.stop());
  EXPECT_FALSE(server.running());
}
