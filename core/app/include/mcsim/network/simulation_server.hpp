#pragma once

#include "mcsim/concurrent/thread_safe_queue.hpp"
#include "mcsim/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace mcsim {

// -----------------------------------------------------------------------------
// SimulationServer — ZeroMQ boundary between the engine and its host
// -----------------------------------------------------------------------------
//
// @brief  Accepts commands from a host on a REP socket and streams every run
//         event to it, as JSON, on a PUB socket.
//
// @details
// Two sockets share one server thread:
//
//   1. REP socket (default tcp://127.0.0.1:5556):
//      One request string per message: "PING", "STATUS", "CANCEL" or
//      "RUN <input json>". Each is passed to command_handler_ (bound to
//      SimulationEngine::executeCommand()) and its JSON reply is sent back.
//      ZMQ_RCVTIMEO keeps recv() from blocking forever, so the loop also
//      gets to drain the outbound queue.
//
//   2. PUB socket (default tcp://127.0.0.1:5557):
//      Progress, terminal and failure messages (MessageCodec format), in the
//      order the worker published the events. Events reach the server
//      through outbound_queue_, filled by pushEvent() on the worker thread,
//      so JSON encoding and socket I/O never slow down the simulation loop.
//
// Thread model:
//   Constructed and destroyed on the engine's owning thread. start() opens
//   the sockets and spawns the server thread; stop() joins it. pushEvent()
//   is safe from any thread. command_handler_ runs on the server thread.
//
// Ownership:
//   Owned by SimulationEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the outbound queue and the thread.
// -----------------------------------------------------------------------------
class SimulationServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @brief  Stores parameters; no socket is opened until start().
  //
  // @param  command_handler  Maps one command string to one JSON reply.
  // @param  cmd_endpoint     REP socket endpoint.
  // @param  pub_endpoint     PUB socket endpoint.
  // -------------------------------------------------------------------------
  explicit SimulationServer(CommandHandler command_handler,
                            std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                            std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: stop() if still running.
  ~SimulationServer();

  SimulationServer(const SimulationServer&) = delete;
  SimulationServer& operator=(const SimulationServer&) = delete;
  SimulationServer(SimulationServer&&) = delete;
  SimulationServer& operator=(SimulationServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Creates the context, binds both sockets, spawns the thread.
  //
  // Idempotent. Throws zmq::error_t if an endpoint cannot be bound; no
  // thread is started in that case.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Publishes whatever is still queued, joins the thread, closes
  //         the sockets. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // pushEvent(event)
  // -------------------------------------------------------------------------
  //
  // @brief  Queues a run event for publication on the PUB socket.
  //
  // Called from EventBus subscribers on the worker thread. O(1); never
  // touches a socket.
  // -------------------------------------------------------------------------
  void pushEvent(Event event);

  // Events queued but not yet published (snapshot).
  std::size_t pendingEvents() const { return outbound_queue_.size(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Server thread: publish queued events, then poll for one command.
  void run();

  // Drains outbound_queue_ onto the PUB socket.
  void processOutbound();

  // Receives at most one command (bounded by kPollTimeoutMs) and replies.
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> outbound_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace mcsim
