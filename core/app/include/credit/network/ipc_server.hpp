#pragma once

#include "credit/concurrent/thread_safe_queue.hpp"
#include "credit/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace credit {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry endpoints
// -----------------------------------------------------------------------------
//
// @brief  Serves LedgerService commands over a REP socket and publishes
//         ledger events as JSON over a PUB socket.
//
// @details
// Sockets:
//   REP (cmd_endpoint)  request/reply; each request string is passed to the
//                       CommandHandler and its return value sent back.
//   PUB (pub_endpoint)  one JSON object per ledger event, e.g.
//                       {"type":"loan_opened","loan_id":1,...}
//
// Thread model:
//   start() spawns one background thread that owns both sockets and loops:
//   drain the telemetry queue, then wait up to kPollTimeoutMs for a command.
//   pushTelemetry() may be called from any thread; it only enqueues.
//   The CommandHandler runs on the server thread.
//
// Lifetime:
//   stop() (also called by the destructor) joins the thread and closes the
//   sockets. Events still queued at shutdown are flushed first.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and starts the server thread. Idempotent.
  void start();

  // Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // JSON rendering used for the PUB stream.
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

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

}  // namespace credit
