#pragma once

#include "rxpos/concurrent/thread_safe_queue.hpp"
#include "rxpos/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace rxpos {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ channel between the register front-end and the engine
// -----------------------------------------------------------------------------
//
// @brief  Runs one worker thread serving two sockets:
//
//   1. REP socket (default tcp://127.0.0.1:5556)
//      Receives JSON command requests from the till front-end, hands each to
//      the command handler (PosEngine::executeCommand), and sends back the
//      JSON reply.
//
//   2. PUB socket (default tcp://127.0.0.1:5557)
//      Broadcasts telemetry JSON for sale_completed, stock_alert, and
//      low_stock events. Events arrive through a ThreadSafeQueue so the
//      thread that completed the sale never waits on socket I/O.
//
// Thread model:
//   start()/stop() are called from the owning thread (PosEngine, main).
//   pushTelemetry() may be called from any thread. The command handler runs
//   on the IPC worker thread.
//
// Ownership:
//   Owned by PosEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue, and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds both sockets, sets ZMQ_RCVTIMEO on the REP
  // socket, and spawns the worker. No-op if already running. A bind failure
  // propagates as zmq::error_t.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it, closes the sockets. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  // Queues an event for publication on the PUB socket.
  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return The JSON message published for `event`, with a "type" field of
  //         "sale_completed", "stock_alert" or "low_stock".
  //
  // Pure; public so tests can check the wire format without sockets.
  // -------------------------------------------------------------------------
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker loop: drain telemetry, then wait up to kPollTimeoutMs for a
  // command. Publishes whatever is left in the queue before exiting.
  void run();

  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace rxpos
