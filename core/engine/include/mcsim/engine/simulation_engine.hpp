#pragma once

#include "mcsim/concurrent/simulation_worker.hpp"
#include "mcsim/domain/simulation_request.hpp"
#include "mcsim/eventbus/event_bus.hpp"
#include "mcsim/network/simulation_server.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mcsim {

// -----------------------------------------------------------------------------
// SimulationEngine
// -----------------------------------------------------------------------------
//
// @brief  Central orchestrator that owns the simulation worker and the
//         ZeroMQ server, and answers host commands.
//
// @details
// Provides a start/stop lifecycle so that main() and tests can use the
// engine without wiring the worker, the bus and the server by hand.
//
// Thread layout:
//
//   simulation worker thread  → SimulationDriver (estimation, paths,
//                               aggregation); publishes every run event
//   server thread             → REP command loop + PUB event publication
//   main thread               → engine.start(), wait for shutdown,
//                               engine.stop()
//
// Cross-thread bridges (wired in start()):
//   1. worker bus → last_progress_ (atomic), read by STATUS
//   2. worker bus → SimulationServer::pushEvent() (outbound queue)
//
// Thread model:
//   Constructed and destroyed on the caller's thread. submit(), cancel()
//   and executeCommand() are safe from any thread; executeCommand() normally
//   runs on the server thread.
//
// Ownership:
//   SimulationEngine
//    ├── worker_   (SimulationWorker — value member, owns its bus)
//    └── server_   (unique_ptr<SimulationServer>, absent when either
//                   endpoint is empty)
//
// The worker is stopped before the server is destroyed, since the worker's
// bus forwards into the server. The server's command handler only touches
// worker_, which outlives it as a value member.
// -----------------------------------------------------------------------------
class SimulationEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  cmd_endpoint  ZMQ endpoint for the command (REP) socket. If
  //                       empty, no SimulationServer is created (unit tests
  //                       call executeCommand() directly).
  // @param  pub_endpoint  ZMQ endpoint for the progress (PUB) socket. If
  //                       empty, no SimulationServer is created.
  //
  // No thread is spawned and no socket is opened here.
  // -------------------------------------------------------------------------
  explicit SimulationEngine(std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                            std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // Destructor calls stop().
  ~SimulationEngine();

  SimulationEngine(const SimulationEngine&) = delete;
  SimulationEngine& operator=(const SimulationEngine&) = delete;
  SimulationEngine(SimulationEngine&&) = delete;
  SimulationEngine& operator=(SimulationEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // Startup sequence:
  //   1. Subscribe the progress tracker to the worker bus.
  //   2. Start the worker thread.
  //   3. Create and start the server, then bridge the worker bus to it.
  //
  // Idempotent. Throws zmq::error_t if an endpoint cannot be bound; the
  // engine is left stopped in that case.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // Shutdown sequence:
  //   1. Stop the worker (cancels the run in flight, joins). No event is
  //      published after this point.
  //   2. Stop the server (queued events are flushed, then sockets close).
  //   3. Remove the engine's bus subscriptions.
  //
  // Idempotent; start() may be called again.
  // -------------------------------------------------------------------------
  void stop();

  // Queues a request on the worker. Returns its run id.
  // @throws std::invalid_argument if the request is invalid.
  std::uint64_t submit(domain::SimulationRequest request);

  // Requests cancellation of the run in flight.
  void cancel();

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Processes one host command and returns a JSON reply.
  //
  // Supported commands:
  //   "PING"         → {"status":"ok","response":"PONG"}
  //   "STATUS"       → {"status":"ok","busy":bool,"progress":int,
  //                     "queued":int,"runs_completed":int,
  //                     "runs_failed":int,"runs_cancelled":int}
  //   "RUN <json>"   → {"status":"ok","response":"Simulation queued",
  //                     "run_id":int}
  //                    or {"status":"error","response":"..."} when the
  //                    input message is rejected
  //   "CANCEL"       → {"status":"ok","response":"Cancel requested"}
  //   other          → {"status":"error","response":"Unknown command: ..."}
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Progress of the most recent run event (0 before the first run).
  int lastProgress() const { return last_progress_.load(); }

  bool isRunning() const { return running_; }

  // Worker bus, for external subscribers (CLI, tests).
  EventBus& eventBus() { return worker_.eventBus(); }

 private:
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  SimulationWorker worker_;
  std::unique_ptr<SimulationServer> server_;

  std::vector<EventBus::SubscriptionId> subscriptions_;
  std::atomic<int> last_progress_{0};
  bool running_{false};
};

}  // namespace mcsim
